//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Exception Classes
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>
#include <exception>

//-------------------------------------- Project  Headers ------------------------------------------

#include "skexception.h"

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

namespace stylekit {


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Constructor
 */
StyleKitException::StyleKitException():std::exception() {
}


/**
 * @brief Constructor
 *
 * @param function Function name that caused the exception
 * @param file File name that caused the exception
 * @param line Line in file that caused the exception
 * @param format Format string that carries additional information / custom message
 */
StyleKitException::StyleKitException(const char *function, const char *file, int line, const char *format, ...) {
    char tmp[MAX_MESSAGE_SIZE];
    va_list args;
    va_start(args,format);
    vsnprintf(tmp,MAX_MESSAGE_SIZE,format,args);
    va_end(args);
    generateWhat(function, file, line, "StyleKitException", tmp);
}


/**
 * @brief Destructor
 */
StyleKitException::~StyleKitException() throw() {
}


/**
 * @brief Retrieve exception message
 *
 * @return Pointer to null-terminated string with information about the exception
 */
const char * StyleKitException::what() const throw() {
    if (message_.size()>0) return message_.c_str();
    else return "StyleKitException";
}

/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/


/**
 * @brief Generate exception message
 *
 * @param function Function name that caused the exception
 * @param file File name that caused the exception
 * @param line Line in file that caused the exception
 * @param ex Exception (class) name
 * @param err Custom exception message
 */
void StyleKitException::generateWhat(const char *function, const char *file, int line, const char *ex, const char *err) {
    char tmp[MAX_MESSAGE_SIZE+MAX_INFO_SIZE];
    snprintf(tmp,sizeof(tmp),"%s:%d [%s] threw %s\nDetailed error: %s\n",file,line,function,ex,err);
    message_ = std::string(tmp);
    detail_ = std::string(err);
}


} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
