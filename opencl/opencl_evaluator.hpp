#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <mutex>
#include <string>
#include <vector>
#include "local_search.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief Owning handle of an OpenCL buffer, released on destruction.
 */
class ClBuffer {
public:
    ClBuffer() = default;
    explicit ClBuffer(cl_mem mem) : mem_(mem) {}
    ~ClBuffer() { reset(); }

    ClBuffer(const ClBuffer&) = delete;
    ClBuffer& operator=(const ClBuffer&) = delete;

    /// Release the held buffer and take ownership of @p mem.
    void reset(cl_mem mem = nullptr) {
        if (mem_) clReleaseMemObject(mem_);
        mem_ = mem;
    }

    cl_mem get() const { return mem_; }

private:
    cl_mem mem_ = nullptr;
};

/**
 * @brief OpenCL helper context for batched move-gain evaluation.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program used
 * to compute the gains of many neighborhood candidates in parallel. Gains
 * are computed with the same block layout and formula as
 * Neighborhood::gain(), so the host-side reduction picks the same move as
 * the CPU back ends.
 */
class MoveGainOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the program containing the gain kernel. Throws
     * std::runtime_error if OpenCL setup fails.
     */
    MoveGainOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~MoveGainOpenCLContext();

    MoveGainOpenCLContext(const MoveGainOpenCLContext&) = delete;
    MoveGainOpenCLContext& operator=(const MoveGainOpenCLContext&) = delete;

    /**
     * @brief Upload the vote, row and pin arrays of a neighborhood.
     *
     * Must be called once per neighborhood before evaluateBatch().
     */
    void loadNeighborhood(const Neighborhood& nb);

    /**
     * @brief Compute gains of candidates [begin, begin + count) of the loaded neighborhood.
     *
     * On return gains[i] is the gain of candidate begin + i, or
     * MoveChoice::kNoMove for candidates that are not moves.
     */
    void evaluateBatch(int begin, int count, std::vector<int>& gains);

    /// Name of the selected OpenCL device.
    const std::string& deviceName() const { return deviceName_; }

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;
    cl_kernel kernel = nullptr;

    /// Device-side copies of the current neighborhood's arrays.
    ClBuffer d_assignedVotes;
    ClBuffer d_assignedPinned;
    ClBuffer d_assignedRows;
    ClBuffer d_emptyRows;
    ClBuffer d_unplacedVotes;
    ClBuffer d_rowStarts;
    ClBuffer d_rowVotes;
    ClBuffer d_rowPenalties;
    bool loaded_ = false;

    /// Block layout of the current neighborhood.
    int nA_ = 0, nE_ = 0, nU_ = 0;
    int swapEnd_ = 0, moveEnd_ = 0, exchangeEnd_ = 0, size_ = 0;

    std::string deviceName_;

    /// The queue and the loaded buffers are shared state.
    std::mutex mutex_;

    cl_program buildProgram(const char* src, const std::string& options);

    /// Create a read-only buffer holding @p bytes of @p data.
    cl_mem upload(const void* data, size_t bytes, const char* what);
};
