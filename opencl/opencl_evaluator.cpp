///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include "logging.hpp"
#include "scorer.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* MOVE_GAIN_KERNEL_SRC = R"(
#define NO_MOVE (-2147483647 - 1)
#define GAIN_MAX 2147483647

// Adjacent-product sum of a descending row with one removeVotes dropped and
// insertVotes merged in; non-positive values mean none.
long edited_row_sum(__global const int* votes, int count, int removeVotes, int insertVotes) {
    long sum = 0;
    long prev = 0;
    int removed = removeVotes <= 0;
    int inserted = insertVotes <= 0;
    for (int k = 0; k < count; ++k) {
        int v = votes[k];
        if (!removed && v == removeVotes) {
            removed = 1;
            continue;
        }
        if (!inserted && insertVotes >= v) {
            sum += prev * insertVotes;
            prev = insertVotes;
            inserted = 1;
        }
        sum += prev * v;
        prev = v;
    }
    if (!inserted) sum += prev * insertVotes;
    return sum;
}

long row_penalty(__global const int* rowStarts, __global const int* rowVotes,
                 int row, int removeVotes, int insertVotes) {
    int start = rowStarts[row];
    long weight = CONFLICT_TENTHS + (long)LATE_TENTHS * row;
    return edited_row_sum(rowVotes + start, rowStarts[row + 1] - start, removeVotes, insertVotes) * weight;
}

int relocation_gain(__global const int* rowStarts, __global const int* rowVotes,
                    __global const long* rowPenalties,
                    int rowA, int votesA, int rowB, int votesB) {
    if (rowA == rowB || votesA == votesB) return 0;
    long before = rowPenalties[rowA] + rowPenalties[rowB];
    long after = row_penalty(rowStarts, rowVotes, rowA, votesA, votesB)
               + row_penalty(rowStarts, rowVotes, rowB, votesB, votesA);
    long reduction = before - after;
    if (reduction > GAIN_MAX) return GAIN_MAX;
    if (reduction < -GAIN_MAX) return -GAIN_MAX;
    return (int)reduction;
}

__kernel void eval_move_gains(
    const int begin,
    const int count,
    const int nA,
    const int nE,
    const int nU,
    const int swapEnd,
    const int moveEnd,
    const int exchangeEnd,
    const int size,
    __global const int* assignedVotes,   // size: nA (slot order)
    __global const int* assignedPinned,  // size: nA
    __global const int* assignedRows,    // size: nA
    __global const int* emptyRows,       // size: nE (slot order)
    __global const int* unplacedVotes,   // size: nU (priority order)
    __global const int* rowStarts,       // size: rows + 1
    __global const int* rowVotes,        // positive votes per row, descending
    __global const long* rowPenalties,   // size: rows
    __global int* gainOut                // size: count
) {
    int gid = get_global_id(0);
    if (gid >= count) return;

    int index = begin + gid;
    int gain = NO_MOVE;

    if (index < 0 || index >= size) {
        gain = NO_MOVE;
    } else if (index < swapEnd) {
        // Swap of two assigned slots: only unpinned i < j is a move.
        int i = index / nA;
        int j = index % nA;
        if (i < j && !assignedPinned[i] && !assignedPinned[j]) {
            gain = relocation_gain(rowStarts, rowVotes, rowPenalties,
                                   assignedRows[i], assignedVotes[i], assignedRows[j], assignedVotes[j]);
        }
    } else if (index < moveEnd) {
        // Assigned session into an empty slot.
        int k = index - swapEnd;
        int i = k / nE;
        if (!assignedPinned[i]) {
            gain = relocation_gain(rowStarts, rowVotes, rowPenalties,
                                   assignedRows[i], assignedVotes[i], emptyRows[k % nE], 0);
        }
    } else if (index < exchangeEnd) {
        // Unplaced session replaces an assigned one.
        int k = index - moveEnd;
        int i = k / nU;
        if (!assignedPinned[i]) gain = unplacedVotes[k % nU] - assignedVotes[i];
    } else {
        // Unplaced session into an empty slot.
        int k = index - exchangeEnd;
        gain = unplacedVotes[k / nE];
    }

    gainOut[gid] = gain;
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
MoveGainOpenCLContext::MoveGainOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        LogLine(LogLevel::INFO, "opencl") << "no GPU found, trying CPU";
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "querying device name");
    deviceName_ = name;
    LogLine(LogLevel::INFO, "opencl") << "using device: " << deviceName_;

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

#if CL_TARGET_OPENCL_VERSION >= 200
    cl_queue_properties props[] = { CL_QUEUE_PROPERTIES, 0, 0 };
    queue = clCreateCommandQueueWithProperties(context, device, props, &err);
#else
    queue = clCreateCommandQueue(context, device, 0, &err);
#endif
    checkError(err, "creating command queue");

    std::stringstream options;
    options << "-DCONFLICT_TENTHS=" << kConflictWeightTenths << " -DLATE_TENTHS=" << kLateWeightTenths;
    program = buildProgram(MOVE_GAIN_KERNEL_SRC, options.str());

    kernel = clCreateKernel(program, "eval_move_gains", &err);
    checkError(err, "creating kernel");
}

MoveGainOpenCLContext::~MoveGainOpenCLContext() {
    d_assignedVotes.reset();
    d_assignedPinned.reset();
    d_assignedRows.reset();
    d_emptyRows.reset();
    d_unplacedVotes.reset();
    d_rowStarts.reset();
    d_rowVotes.reset();
    d_rowPenalties.reset();
    if (kernel)  clReleaseKernel(kernel);
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program MoveGainOpenCLContext::buildProgram(const char* src, const std::string& options) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, options.c_str(), nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        LogLine(LogLevel::ERROR, "opencl") << "build log:\n" << log.data();
        clReleaseProgram(prog);
        throw std::runtime_error("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///  NEIGHBORHOOD DATA  ///
///////////////////////////
/**
 * @brief Upload host data into a new read-only buffer.
 *
 * Empty arrays are uploaded as one zero padding element, since OpenCL
 * buffers cannot have zero size; the kernel never reads them in that case.
 */
cl_mem MoveGainOpenCLContext::upload(const void* data, size_t bytes, const char* what) {
    cl_int err = CL_SUCCESS;
    cl_long padding = 0;
    if (bytes == 0) {
        data = &padding;
        bytes = sizeof(padding);
    }
    cl_mem mem = clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR,
                                bytes, const_cast<void*>(data), &err);
    checkError(err, what);
    return mem;
}

/**
 * @brief Replace the device-side arrays and block layout.
 */
void MoveGainOpenCLContext::loadNeighborhood(const Neighborhood& nb) {
    std::lock_guard<std::mutex> lock(mutex_);
    loaded_ = false;

    nA_ = nb.assignedCount();
    nE_ = nb.emptyCount();
    nU_ = nb.unplacedCount();
    swapEnd_ = nb.blockStart(MoveType::MOVE_TO_EMPTY);
    moveEnd_ = nb.blockStart(MoveType::EXCHANGE_UNASSIGNED);
    exchangeEnd_ = nb.blockStart(MoveType::PLACE_UNASSIGNED);
    size_ = nb.size();

    auto ints = [](const std::vector<int>& v) { return v.size() * sizeof(int); };
    std::vector<cl_long> penalties(nb.rowPenalties().begin(), nb.rowPenalties().end());

    d_assignedVotes.reset(upload(nb.assignedVotes().data(), ints(nb.assignedVotes()), "creating d_assignedVotes"));
    d_assignedPinned.reset(upload(nb.assignedPinned().data(), ints(nb.assignedPinned()), "creating d_assignedPinned"));
    d_assignedRows.reset(upload(nb.assignedRows().data(), ints(nb.assignedRows()), "creating d_assignedRows"));
    d_emptyRows.reset(upload(nb.emptyRows().data(), ints(nb.emptyRows()), "creating d_emptyRows"));
    d_unplacedVotes.reset(upload(nb.unplacedVotes().data(), ints(nb.unplacedVotes()), "creating d_unplacedVotes"));
    d_rowStarts.reset(upload(nb.rowStarts().data(), ints(nb.rowStarts()), "creating d_rowStarts"));
    d_rowVotes.reset(upload(nb.rowVotes().data(), ints(nb.rowVotes()), "creating d_rowVotes"));
    d_rowPenalties.reset(upload(penalties.data(), penalties.size() * sizeof(cl_long), "creating d_rowPenalties"));
    loaded_ = true;
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
void MoveGainOpenCLContext::evaluateBatch(int begin, int count, std::vector<int>& gains) {
    std::lock_guard<std::mutex> lock(mutex_);
    cl_int err = CL_SUCCESS;

    gains.assign(std::max(count, 0), MoveChoice::kNoMove);
    if (count <= 0) return;
    if (!loaded_) {
        throw std::runtime_error("evaluateBatch called before loadNeighborhood");
    }

    ClBuffer d_gain(clCreateBuffer(context, CL_MEM_WRITE_ONLY, count * sizeof(int), nullptr, &err));
    checkError(err, "creating d_gain");

    const cl_mem buffers[] = {
        d_assignedVotes.get(), d_assignedPinned.get(), d_assignedRows.get(), d_emptyRows.get(),
        d_unplacedVotes.get(), d_rowStarts.get(), d_rowVotes.get(), d_rowPenalties.get(), d_gain.get()
    };

    int arg = 0;
    err = clSetKernelArg(kernel, arg++, sizeof(int), &begin); checkError(err, "arg begin");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &count); checkError(err, "arg count");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &nA_); checkError(err, "arg nA");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &nE_); checkError(err, "arg nE");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &nU_); checkError(err, "arg nU");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &swapEnd_); checkError(err, "arg swapEnd");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &moveEnd_); checkError(err, "arg moveEnd");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &exchangeEnd_); checkError(err, "arg exchangeEnd");
    err = clSetKernelArg(kernel, arg++, sizeof(int), &size_); checkError(err, "arg size");
    for (const cl_mem& buffer : buffers) {
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &buffer);
        checkError(err, "setting buffer argument");
    }

    size_t global = (size_t)count;
    err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
    checkError(err, "enqueueing eval_move_gains");
    err = clFinish(queue);
    checkError(err, "running eval_move_gains");
    err = clEnqueueReadBuffer(queue, d_gain.get(), CL_TRUE, 0, count * sizeof(int), gains.data(), 0, nullptr, nullptr);
    checkError(err, "reading gains");
}
