//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Buffer (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../common/skexception.h"
#include "cpubuffershape.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

/**
 * @brief Tensor storage on the CPU
 *
 * A CPUBuffer wraps a contiguous block of single-precision floating-point data with a (fully
 * defined) CPUBufferShape in row-major order. Layers treat buffers as immutable values: a layer
 * never writes into its input buffer, every forward pass produces a new buffer.
 *
 * In order to access the content of a CPUBuffer, a call to map() will provide a (raw) pointer to
 * the data stored in the buffer. This call \b must be matched with a call to unmap() after the
 * access has been done. Read-only mappings may be held by several threads at the same time, a
 * writable mapping is exclusive. The scoped ReadMapping and WriteMapping classes wait until the
 * buffer becomes available.
 */
class CPUBuffer {
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    explicit CPUBuffer(const CPUBufferShape& shape);
    CPUBuffer(const CPUBufferShape& shape, const float *data);
    CPUBuffer(const CPUBuffer&) = delete;
    CPUBuffer& operator=(const CPUBuffer&) = delete;
    ~CPUBuffer();

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    [[nodiscard]] size_t bytes() const;
    [[nodiscard]] size_t elements() const;
    [[nodiscard]] std::unique_ptr<CPUBuffer> copy() const;
    [[nodiscard]] std::unique_ptr<CPUBuffer> reshape(const CPUBufferShape& shape) const;
    [[nodiscard]] std::unique_ptr<CPUBuffer> scale(float factor) const;

    /**
     * @brief Fill CPU buffer with single value
     *
     * @param value Value to fill buffer with
     */
    void fill(float value) {
        size_t num = elements();
        for (size_t i=0; i < num; i++) memory_[i] = value;
    }

    /**
     * @brief Retrieve shape for this buffer
     *
     * @return CPUBufferShape instance that stores the buffer shape
     */
    [[nodiscard]] const CPUBufferShape & shape() const {
        return shape_;
    }

    /**
     * @brief Map data stored in this object to memory and retrieve (read only) pointer
     *
     * @param wait If set to \c true, block until the buffer is available for reading
     *
     * @return Pointer to data in this object for reading purposes or \c nullptr if mapping could
     *         not be done
     *
     * Any number of readers may map a buffer at the same time. Must be matched by a call to the
     * \c const version of unmap().
     */
    const float * map(bool wait=false) const {
        if (!mapped_.try_lock_shared()) {
            if (!wait) return nullptr;
            mapped_.lock_shared();
        }
        return memory_;
    }

    /**
     * @brief Map data stored in this object to memory and retrieve (writable) pointer
     *
     * @param wait If set to \c true, block until the buffer is available for writing
     *
     * @return Pointer to data in this object or \c nullptr if mapping could not be done
     *
     * A writable mapping is exclusive. Must be matched by a call to the non-const version of
     * unmap().
     */
    float * map(bool wait=false) {
        if (!mapped_.try_lock()) {
            if (!wait) return nullptr;
            mapped_.lock();
        }
        return memory_;
    }

    /**
     * @brief Release a read-only mapping obtained from the \c const version of map()
     *
     * @warning Discard all raw pointers obtained from map() when unmapping the buffer.
     */
    void unmap() const {
        mapped_.unlock_shared();
    }

    /**
     * @brief Release a writable mapping obtained from the non-const version of map()
     */
    void unmap() {
        mapped_.unlock();
    }

    /**
     * @brief Execute function that reads from this buffer
     *
     * @param func Function to execute, receives the mapped data pointer
     *
     * Blocks while the buffer is mapped for writing.
     */
    void with(const std::function<void(const float *)> & func) const;

 protected:
    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    CPUBufferShape shape_;                    //!< Shape for this buffer
    float * memory_ = nullptr;                //!< Pointer to buffer memory
    mutable std::shared_mutex mapped_;        //!< Shared for readers, exclusive for writers
};


/**
 * @brief Scoped mapping of a CPUBuffer for reading
 *
 * Maps the supplied buffer on construction and unmaps it on destruction, so that a buffer does not
 * stay locked when an exception leaves the scope.
 */
class ReadMapping {
 public:
    explicit ReadMapping(const CPUBuffer & buffer) : buffer_(buffer) {
        data_ = buffer.map(true);
    }
    ReadMapping(const ReadMapping&) = delete;
    ReadMapping& operator=(const ReadMapping&) = delete;
    ~ReadMapping() {
        buffer_.unmap();
    }
    [[nodiscard]] const float * data() const {
        return data_;
    }
 private:
    const CPUBuffer & buffer_;
    const float * data_ = nullptr;
};


/**
 * @brief Scoped mapping of a CPUBuffer for writing
 *
 * @see ReadMapping
 */
class WriteMapping {
 public:
    explicit WriteMapping(CPUBuffer & buffer) : buffer_(buffer) {
        data_ = buffer.map(true);
    }
    WriteMapping(const WriteMapping&) = delete;
    WriteMapping& operator=(const WriteMapping&) = delete;
    ~WriteMapping() {
        buffer_.unmap();
    }
    [[nodiscard]] float * data() const {
        return data_;
    }
 private:
    CPUBuffer & buffer_;
    float * data_ = nullptr;
};


inline void CPUBuffer::with(const std::function<void(const float *)> & func) const {
    ReadMapping map(*this);
    func(map.data());
}

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
