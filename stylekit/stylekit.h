//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Main Include File (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//-------------------------------------- Project  Headers ------------------------------------------

#include "common/skexception.h"
#include "common/logging.h"
#include "common/performance.h"
#include "cpu/cpubuffer.h"
#include "cpu/cpulayer.h"
#include "cpu/cpulayerfactory.h"
#include "base/layerconfig.h"
#include "base/memoryprovider.h"
#include "base/neuralnetwork.h"
#include "transfer/styletransfer.h"

// vim: set expandtab ts=4 sw=4:
