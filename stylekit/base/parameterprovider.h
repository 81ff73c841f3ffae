//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Parameter Provider Interface (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>
#include <any>
#include <atomic>
#include <functional>
#include <cstdint>

//-------------------------------------- Project  Headers ------------------------------------------


//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit {

/**
 * @brief Wrapper class that keeps track of reference counts for data blobs (base)
 *
 * This class is used to provide an interface to a raw pointer of underlying data with associated
 * reference counting. A wrapper instance never takes ownership over the data it wraps, but rather
 * is used to (optionally) inform the owner of the data when it is no longer needed.
 */
class DataWrapper {
    friend class DataBlob;
 public:
    virtual ~DataWrapper() = default;

    /**
     * @brief Retrieve (raw) pointer to underlying data
     *
     * @return Pointer to underlying data, may be invalid, check with std::any::has_value()
     */
    [[nodiscard]] virtual const std::any get() const = 0;

 protected:

    virtual void inc() const {
        refCount_.fetch_add(1);
    }

    virtual int dec() const {
        return refCount_.fetch_sub(1)-1;
    }

    mutable std::atomic<int> refCount_{0};
};


/**
 * @brief Default data-wrapper class
 *
 * @tparam T Data type that is wrapped
 *
 * Stores a raw pointer to data that is fully held in memory.
 */
template<typename T>
class DefaultDataWrapper : public DataWrapper {
 public:
    explicit DefaultDataWrapper(const T * ptr) : ptr_(ptr) {
    }

    const std::any get() const override {
        return std::any(ptr_);
    }

 protected:
    const T * ptr_;
};


/**
 * @brief Handle to layer parameter data
 *
 * Wraps a DataWrapper instance and provides access to its underlying pointer. The life-cycle of
 * this object determines the validity of the pointers obtained from it, do not use a pointer
 * retrieved by get() after the DataBlob has been destroyed.
 */
class DataBlob {
 public:
    explicit DataBlob(DataWrapper * wrapper = nullptr) : wrapper_(wrapper) {
        if (wrapper_) wrapper_->inc();
    }

    DataBlob(const DataBlob &src) : wrapper_(src.wrapper_) {
        if (wrapper_) wrapper_->inc();
    }

    DataBlob& operator=(const DataBlob& src) {
        if (this == &src) return *this;
        if (wrapper_) wrapper_->dec();
        wrapper_ = src.wrapper_;
        if (wrapper_) wrapper_->inc();
        return *this;
    }

    ~DataBlob() {
        if (wrapper_) wrapper_->dec();
    }

    /**
     * @brief Retrieve (raw) pointer to underlying data
     *
     * @return Pointer to underlying data, may be invalid, check with std::any::has_value()
     */
    [[nodiscard]] std::any get() const {
        if (wrapper_) return wrapper_->get();
        else return {};
    }

    /**
     * @brief Check if this object is empty
     *
     * @retval true object has no data wrapped
     * @retval false object has data wrapped
     */
    [[nodiscard]] bool empty() const {
        return wrapper_ == nullptr;
    }

 private:
    DataWrapper * wrapper_ = nullptr;
};


/**
 * @brief Scoped access to layer parameter data via a function
 *
 * The supplied function is invoked with the underlying pointer while the data is guaranteed to be
 * valid.
 */
class DataBlobMapper {
 public:
    explicit DataBlobMapper(const DataBlob& src) : wrap_(src) {
    }
    void with(const std::function<void(const std::any&)> & func) const {
        func(wrap_.get());
    }
 private:
    const DataBlob wrap_;
};


/**
 * @brief Base class for network parameter providers
 *
 * This class is used to provide weights to the network on a layer-by-layer basis. Actual parameter
 * providers shall derive from this class and implement/override the interface as needed. The
 * normalization layers query their parameters under the names \c <layername>.gamma and
 * \c <layername>.beta, using the layer number as \p layerNo and 0 as \p subIndex.
 *
 * @code
 * MemoryParameterProvider weights;
 * weights.set("norm1.gamma", gamma);
 * network.setup(inputShape);
 * network.loadParameters(&weights);
 * @endcode
 *
 * @see MemoryParameterProvider, NeuralNetwork::loadParameters()
 */
class ParameterProvider {
 public:
    ParameterProvider() = default;
    virtual ~ParameterProvider() = default;
    // ------------------------------------------------------------------------
    // Mapper / Getter interface
    // ------------------------------------------------------------------------
    [[nodiscard]] const DataBlobMapper map(const std::string& name, int layerNo, int subIndex) const;
    [[nodiscard]] virtual DataBlob get(const std::string& name, int layerNo, int subIndex) const;

    /**
     * @brief Get number of (float) elements stored for a parameter
     *
     * @param name Name of the parameter
     * @param layerNo Layer number of the requesting layer
     * @param subIndex Sub-index of the parameter, set to 0 if not needed
     *
     * @return Number of elements or -1 if the provider does not know the size
     *
     * Layers use this to validate parameter sizes where the information is available.
     */
    [[nodiscard]] virtual int64_t elements(const std::string& name, int layerNo, int subIndex) const {
        (void)name;
        (void)layerNo;
        (void)subIndex;
        return -1;
    }
};


} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
