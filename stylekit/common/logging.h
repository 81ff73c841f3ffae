//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Very rudimentary logging (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//------------------------------------------------------------------------------

//-------------------------------------- System Headers --------------------------------------------

#if defined(ANDROID)&&!defined(STANDALONE)
#include <android/log.h>
#else
#include <cstdio>
#endif

//-------------------------------------- Project  Headers ------------------------------------------


//------------------------------------- Public Definitions -----------------------------------------


//--------------------------------------- Public Functions -----------------------------------------

#if defined(ANDROID)&&!defined(STANDALONE)

#if !defined(SKLOGD) && !defined(SKLOGE)
#define STYLEKIT_LOG_TAG "stylekit"
#ifdef DEBUG
#define SKLOGD(fmt,...) __android_log_print(ANDROID_LOG_DEBUG,STYLEKIT_LOG_TAG,fmt,##__VA_ARGS__);
#else
#define SKLOGD(fmt,...)
#endif
#define SKLOGE(fmt,...) __android_log_print(ANDROID_LOG_ERROR,STYLEKIT_LOG_TAG,fmt,##__VA_ARGS__);
#define SKLOGW(fmt,...) __android_log_print(ANDROID_LOG_WARN,STYLEKIT_LOG_TAG,fmt,##__VA_ARGS__);
#define SKLOGI(fmt,...) __android_log_print(ANDROID_LOG_INFO,STYLEKIT_LOG_TAG,fmt,##__VA_ARGS__);
#endif

#else

#ifdef DEBUG
#define SKLOGD(fmt,...) printf(fmt"\n",##__VA_ARGS__);
#else
#define SKLOGD(fmt,...)
#endif
#define SKLOGI(fmt,...) printf(fmt"\n",##__VA_ARGS__);
#define SKLOGE(fmt,...) fprintf(stderr,fmt"\n",##__VA_ARGS__);
#define SKLOGW(fmt,...) fprintf(stderr,fmt"\n",##__VA_ARGS__);

#endif


// vim: set expandtab ts=4 sw=4:
