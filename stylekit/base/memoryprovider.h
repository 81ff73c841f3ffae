//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// In-Memory Parameter Provider (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>

//-------------------------------------- Project  Headers ------------------------------------------

#include "parameterprovider.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit {

/**
 * @brief Parameter provider that owns named float arrays in memory
 *
 * Parameters are keyed by name only, the layer number and sub-index are ignored.
 *
 * @warning Replacing or removing a parameter invalidates pointers from DataBlob instances that
 *          were obtained for that parameter earlier.
 */
class MemoryParameterProvider : public ParameterProvider {
 public:
    MemoryParameterProvider() = default;
    ~MemoryParameterProvider() override = default;

    void set(const std::string& name, const std::vector<float>& data);
    void set(const std::string& name, const float *data, size_t count);
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] DataBlob get(const std::string& name, int layerNo, int subIndex) const override;
    [[nodiscard]] int64_t elements(const std::string& name, int layerNo, int subIndex) const override;

 private:
    struct Entry {
        std::vector<float> data;
        std::unique_ptr<DefaultDataWrapper<float>> wrapper;
    };
    std::unordered_map<std::string, Entry> params_;     //!< Parameter storage, keyed by name
};

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
