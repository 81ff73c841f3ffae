//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Parameter Provider Interface
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------


//-------------------------------------- Project  Headers ------------------------------------------

#include "parameterprovider.h"

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

namespace stylekit {

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Map parameter for a given layer / parameter-name into a mapper instance
 *
 * @param name Name to identify the parameter by (e.g. \c norm1.gamma )
 * @param layerNo Number of layer to map weights for
 * @param subIndex Sub-index of the parameter, set to 0 if not needed
 *
 * @return Instance of DataBlobMapper which can be used to access the weights within a mapping
 *         function
 *
 * @see get(), InstanceNormLayer::loadParameters(), CondInstanceNormLayer::loadParameters()
 */
const DataBlobMapper ParameterProvider::map(const std::string& name, int layerNo, int subIndex) const {
    return DataBlobMapper(get(name, layerNo, subIndex));
}


/**
 * @brief Get parameters for a given layer
 *
 * @param name Name to identify the parameter by (e.g. \c norm1.gamma )
 * @param layerNo Number of layer to get weights for
 * @param subIndex Sub-index of the parameter, set to 0 if not needed
 *
 * @return Instance of DataBlob which can be used to access the parameters. The default
 *         implementation returns an empty blob
 *
 * @note The life-cycle of the returned DataBlob instance determines the validity of all
 *       pointers retrieved from it.
 */
DataBlob ParameterProvider::get(const std::string& name, int layerNo, int subIndex) const {
    (void)name;
    (void)layerNo;
    (void)subIndex;
    return DataBlob();
}

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
