//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Compiled Layer Collection (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <map>
#include <memory>
#include <string>
#include <unordered_map>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../cpu/cpulayer.h"

//------------------------------------- Public Declarations ----------------------------------------
namespace stylekit {

/**
 * @brief Compounding object for a set of neural network layers
 *
 * This class aggregates a set of neural network layers into a single object which allows for
 * indexing these layers by their layer number. The execution order is defined by the layer numbers,
 * layers are executed in strictly ascending order.
 *
 * Iteration is done in ascending layer order, the iterators behave like the ones of a \c std::map,
 * i.e. \c first is the layer number and \c second is the layer (a cpu::CPULayer variant).
 *
 * Internally, this class stores a shared pointer to the layer storage and passing this object
 * around via copying is a lightweight operation. All copies refer to the same layers.
 */
class CompiledLayers {
    friend class LayerFactory;
 public:
    using storage = std::map<int, cpu::CPULayer>;
    using iterator = storage::iterator;
    using const_iterator = storage::const_iterator;

    /**
     * @brief Constructor
     */
    CompiledLayers() : layers_(std::make_shared<storage>()) {
    }

    /**
     * @brief Access layer by layer number
     *
     * @param number Layer number of the layer to fetch
     *
     * @return Pointer to layer or \c nullptr if there is no layer with that number
     */
    cpu::CPULayer * operator[](int number) {
        auto it = layers_->find(number);
        return (it != layers_->end()) ? &(it->second) : nullptr;
    }

    /**
     * @brief Access layer by layer name
     *
     * @param name Name of layer to fetch
     *
     * @return Pointer to layer or \c nullptr if there is no layer with that name
     */
    cpu::CPULayer * operator[](const std::string& name) {
        auto it = layersByName_.find(name);
        return (it != layersByName_.end()) ? (*this)[it->second] : nullptr;
    }

    [[nodiscard]] size_t numLayers() const {
        return layers_->size();
    }

    [[nodiscard]] bool empty() const {
        return layers_->empty();
    }

    iterator begin() {
        return layers_->begin();
    }

    iterator end() {
        return layers_->end();
    }

    const_iterator begin() const {
        return layers_->cbegin();
    }

    const_iterator end() const {
        return layers_->cend();
    }

 private:
    /**
     * @brief Add a layer to the collection
     *
     * @param layer Layer to add
     *
     * @throws StyleKitException if the number or the name of the layer is already taken
     */
    void setLayer(cpu::CPULayer&& layer) {
        const LayerBase & base = cpu::layerBase(layer);
        int number = base.getNumber();
        std::string name = base.getName();
        if (layers_->count(number) > 0) {
            THROW_EXCEPTION_ARGS(StyleKitException, "A layer already exists at index %d", number);
        }
        if (layersByName_.count(name) > 0) {
            THROW_EXCEPTION_ARGS(StyleKitException, "Layer name %s is used more than once", name.c_str());
        }
        layers_->emplace(number, std::move(layer));
        layersByName_[name] = number;
    }

    std::shared_ptr<storage> layers_;                       //!< Layers that constitute the network, keyed by number
    std::unordered_map<std::string, int> layersByName_;     //!< Index from layer names to layer numbers
};

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
