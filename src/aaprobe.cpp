// aaprobe, grows an AutoArray and reports which growth path the system allowed
#include "autoarray/AutoArray.hpp"
#include "autoarray/VirtualMemory.hpp"

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

DEFINE_uint64(initialCapacity, 1, "Number of records to reserve on creation.");
DEFINE_uint64(growTo, 0, "Capacity to expand to, 0 for twice the initial capacity.");
DEFINE_uint64(fill, 0, "Number of records to write before growing, capped at the initial capacity.");
DEFINE_string(baseAddress, "", "Hex address to map the array at, empty to let the system choose.");
DEFINE_bool(blockAdjacent, false, "Map a page directly after the array to force a relocating expansion.");
DEFINE_bool(verbose, false, "Log each mapping decision.");

namespace {

struct Record {
    uint64_t key;
    uint64_t value;
};

int fail(const std::string& what, const autoarray::MapStatus& status) {
    std::cerr << what << ": " << status.toString() << std::endl;
    return -1;
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("aaprobe [flags], creates and grows a page-mapped array.");
    gflags::ParseCommandLineFlags(&argc, &argv, false);

    spdlog::default_logger()->set_level(FLAGS_verbose ? spdlog::level::trace : spdlog::level::warn);

    auto virtualMemory = autoarray::VirtualMemory::system();
    size_t pageSize = virtualMemory->pageSize();

    void* baseAddress = nullptr;
    if (!FLAGS_baseAddress.empty()) {
        char* end = nullptr;
        auto address = std::strtoull(FLAGS_baseAddress.c_str(), &end, 16);
        if (end == FLAGS_baseAddress.c_str() || *end != '\0') {
            SPDLOG_ERROR("Unable to parse base address '{}'", FLAGS_baseAddress);
            return -1;
        }
        baseAddress = reinterpret_cast<void*>(static_cast<uintptr_t>(address));
    }

    autoarray::MapStatus status;
    auto array = autoarray::AutoArray<Record>::create(FLAGS_initialCapacity, status, baseAddress);
    if (!array) {
        return fail("create", status);
    }

    std::cout << fmt::format("page size: {} bytes, record size: {} bytes\n", pageSize, sizeof(Record));
    std::cout << fmt::format("created: requested {}, capacity {}, mapped {} bytes at {}\n", FLAGS_initialCapacity,
                             array->capacity(), array->mappedSize(), static_cast<void*>(array->data()));

    size_t fill = FLAGS_fill < array->capacity() ? FLAGS_fill : array->capacity();
    for (size_t i = 0; i < fill; ++i) {
        (*array)[i] = Record{i, i * i};
    }
    array->setSize(fill);

    autoarray::MapResult blocker;
    if (FLAGS_blockAdjacent) {
        auto adjacent = reinterpret_cast<uint8_t*>(array->data()) + array->mappedSize();
        blocker = virtualMemory->map(adjacent, pageSize);
        if (!blocker.status.isOk()) {
            return fail("block adjacent page", blocker.status);
        }
    }

    size_t growTo = FLAGS_growTo ? FLAGS_growTo : array->capacity() * 2;
    if (growTo <= array->capacity()) {
        std::cerr << fmt::format("growTo {} does not exceed capacity {}", growTo, array->capacity()) << std::endl;
        return -1;
    }

    void* before = array->data();
    status = array->expand(growTo);
    if (blocker.address && !virtualMemory->unmap(blocker.address, pageSize)) {
        SPDLOG_WARN("Failed to release blocking page at {}", blocker.address);
    }
    if (!status.isOk()) {
        return fail("expand", status);
    }

    for (size_t i = 0; i < fill; ++i) {
        if ((*array)[i].key != i || (*array)[i].value != i * i) {
            std::cerr << fmt::format("record {} changed during expansion", i) << std::endl;
            return -1;
        }
    }

    std::cout << fmt::format("expanded: requested {}, capacity {}, mapped {} bytes at {}, {}\n", growTo,
                             array->capacity(), array->mappedSize(), static_cast<void*>(array->data()),
                             before == array->data() ? "in place" : "relocated");
    std::cout << fmt::format("preserved {} records\n", fill);

    return 0;
}
