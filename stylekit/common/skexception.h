//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Exception Classes (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>
#include <exception>
#include <cstdio>
#include <stdarg.h>

//-------------------------------------- Project  Headers ------------------------------------------


//-------------------------------------- Public Definitions ----------------------------------------

#define THROW_EXCEPTION_ARGS(exclass,...) throw exclass(__PRETTY_FUNCTION__,__FILE__,__LINE__,__VA_ARGS__)

#define CUSTOM_EXCEPTION(name,base)                                                                \
class name:public base {                                                                           \
 public:                                                                                           \
    name():base() {                                                                                \
    }                                                                                              \
    name(const char *func, const char *file, int line, const char *fmt, ...)                       \
               __attribute__ ((format (printf, 5, 6))) : base() {                                  \
        char tmp[MAX_MESSAGE_SIZE];                                                                \
        va_list args;                                                                              \
        va_start(args,fmt);                                                                        \
        vsnprintf(tmp,MAX_MESSAGE_SIZE,fmt,args);                                                  \
        va_end(args);                                                                              \
        generateWhat(func,file,line,#name,tmp);                                                    \
    }                                                                                              \
    ~name() throw() override {                                                                     \
    }                                                                                              \
    name(const name& ex) = default;                                                                \
}


//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit {

/**
 * @brief Base exception class for StyleKit
 *
 * All errors raised by StyleKit derive from this class. Next to the human-readable message, the
 * exception records the function, file and line where it was thrown. Always throw by using the
 * supplied macro, for example:
 *
 * @code
 * if (channels <= 0) {
 *     THROW_EXCEPTION_ARGS(ShapeException,"Illegal channel count %d", channels);
 * }
 * @endcode
 *
 * The three error kinds that the layers raise are declared as subclasses below, so callers can
 * either catch the specific kind or just catch StyleKitException.
 */
class StyleKitException:public std::exception {
 public:
    enum {
        MAX_INFO_SIZE = 768,
        MAX_MESSAGE_SIZE = 4096
    };

    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    StyleKitException();
    StyleKitException(const char *function, const char *file, int line, const char *format, ...)
                      __attribute__ ((format (printf, 5, 6)));
    StyleKitException(const StyleKitException&) = default;
    ~StyleKitException() throw() override;

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    const char * what() const throw() override;

    /**
     * @brief Retrieve the plain error message (without location information)
     *
     * @return Message that was supplied when throwing the exception
     */
    [[nodiscard]] const std::string& detail() const {
        return detail_;
    }

 protected:
    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    void generateWhat(const char *function, const char *file, int line, const char *ex, const char *err);

    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    std::string message_;       //!< Full message including throw location
    std::string detail_;        //!< Plain error message
};


/**
 * @brief Raised when a padding amount is negative or exceeds the extent of the padded axis
 */
CUSTOM_EXCEPTION(InvalidPaddingException, StyleKitException);

/**
 * @brief Raised when a dimension is unknown/out of range or when parameter sizes do not match
 */
CUSTOM_EXCEPTION(ShapeException, StyleKitException);

/**
 * @brief Raised on unsupported layer options or malformed serialized configurations
 */
CUSTOM_EXCEPTION(InvalidConfigException, StyleKitException);

} // stylekit namespace


// vim: set expandtab ts=4 sw=4:
