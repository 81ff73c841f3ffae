//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// In-Memory Parameter Provider
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------


//-------------------------------------- Project  Headers ------------------------------------------

#include "memoryprovider.h"

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

namespace stylekit {

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Store (copy of) parameter data under a name
 *
 * @param name Name of the parameter, for example \c norm1.gamma
 * @param data Parameter values
 */
void MemoryParameterProvider::set(const std::string& name, const std::vector<float>& data) {
    Entry & entry = params_[name];
    entry.data = data;
    entry.wrapper = std::make_unique<DefaultDataWrapper<float>>(entry.data.data());
}


/**
 * @brief Store (copy of) parameter data under a name
 *
 * @param name Name of the parameter
 * @param data Pointer to parameter values
 * @param count Number of elements to copy from \p data
 */
void MemoryParameterProvider::set(const std::string& name, const float *data, size_t count) {
    set(name, std::vector<float>(data, data + count));
}


/**
 * @brief Check if a parameter with the supplied name is stored
 *
 * @param name Name of the parameter
 *
 * @retval true if parameter is available
 * @retval false otherwise
 */
bool MemoryParameterProvider::contains(const std::string& name) const {
    return params_.find(name) != params_.end();
}


/**
 * @copydoc ParameterProvider::get
 */
DataBlob MemoryParameterProvider::get(const std::string& name, int layerNo, int subIndex) const {
    (void)layerNo;
    (void)subIndex;
    auto it = params_.find(name);
    if (it == params_.end()) return DataBlob();
    return DataBlob(it->second.wrapper.get());
}


/**
 * @copydoc ParameterProvider::elements
 */
int64_t MemoryParameterProvider::elements(const std::string& name, int layerNo, int subIndex) const {
    (void)layerNo;
    (void)subIndex;
    auto it = params_.find(name);
    if (it == params_.end()) return -1;
    return (int64_t)it->second.data.size();
}

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
