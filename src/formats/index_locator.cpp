/**
 * Sky Mesh Extractor - Index Locator Implementation
 */

#include "skymesh/index_locator.hpp"
#include "skymesh/mesh_format.hpp"
#include "skymesh/logging.hpp"

#include <array>

namespace skymesh {

using format::read_u16_le;
using format::read_u32_le;

bool IndexLocator::window_valid(std::span<const uint8_t> region, size_t offset, unsigned width,
                                uint32_t vertex_count, uint32_t index_count) {
    if (index_count == 0 || index_count % 3 != 0 || vertex_count == 0) return false;

    const size_t elem = width / 8;
    const size_t bytes = static_cast<size_t>(index_count) * elem;
    if (offset > region.size() || bytes > region.size() - offset) return false;

    const uint8_t* p = region.data() + offset;
    bool any_nonzero = false;
    for (uint32_t i = 0; i < index_count; i++) {
        uint32_t v = (width == 16) ? read_u16_le(p + i * 2) : read_u32_le(p + i * 4);
        if (v >= vertex_count) return false;
        any_nonzero |= (v != 0);
    }
    return any_nonzero;
}

namespace {

std::vector<uint32_t> read_indices(std::span<const uint8_t> region, size_t offset,
                                   unsigned width, uint32_t count) {
    std::vector<uint32_t> indices;
    indices.reserve(count);
    const uint8_t* p = region.data() + offset;
    for (uint32_t i = 0; i < count; i++) {
        indices.push_back(width == 16 ? read_u16_le(p + i * 2) : read_u32_le(p + i * 4));
    }
    return indices;
}

/**
 * Running counts of out-of-range and nonzero values for windows of one width.
 *
 * Windows whose start offsets share a residue modulo the element size overlap
 * element for element, so each residue keeps its own lane and slides it
 * forward. Start offsets must be queried in non-decreasing order; every
 * element then enters and leaves a lane at most once.
 */
class WindowCounter {
public:
    WindowCounter(std::span<const uint8_t> region, unsigned width,
                  uint32_t vertex_count, uint32_t index_count)
        : region_(region), elem_(width / 8), vertex_count_(vertex_count),
          bytes_(static_cast<size_t>(index_count) * (width / 8)) {}

    bool valid_at(size_t start) {
        if (start > region_.size() || bytes_ > region_.size() - start) return false;

        Lane& lane = lanes_[start % elem_];
        if (!lane.primed || start - lane.start >= bytes_) {
            lane = Lane{};
            for (size_t at = start; at < start + bytes_; at += elem_) {
                add(lane, at);
            }
            lane.primed = true;
        } else {
            for (; lane.start < start; lane.start += elem_) {
                remove(lane, lane.start);
                add(lane, lane.start + bytes_);
            }
        }
        lane.start = start;
        return lane.out_of_range == 0 && lane.nonzero > 0;
    }

private:
    struct Lane {
        bool primed = false;
        size_t start = 0;
        size_t out_of_range = 0;
        size_t nonzero = 0;
    };

    uint32_t value(size_t at) const {
        const uint8_t* p = region_.data() + at;
        return elem_ == 2 ? read_u16_le(p) : read_u32_le(p);
    }

    void add(Lane& lane, size_t at) const {
        uint32_t v = value(at);
        if (v >= vertex_count_) lane.out_of_range++;
        if (v != 0) lane.nonzero++;
    }

    void remove(Lane& lane, size_t at) const {
        uint32_t v = value(at);
        if (v >= vertex_count_) lane.out_of_range--;
        if (v != 0) lane.nonzero--;
    }

    std::span<const uint8_t> region_;
    size_t elem_;
    uint32_t vertex_count_;
    size_t bytes_;
    std::array<Lane, 4> lanes_{};
};

} // namespace

Result<IndexRegion> IndexLocator::locate(std::span<const uint8_t> region,
                                         uint32_t vertex_count,
                                         uint32_t index_count,
                                         Logger* logger) const {
    if (index_count == 0 || index_count % 3 != 0) {
        return Error::index_region_not_found(
            "Index count " + std::to_string(index_count) + " is not a positive multiple of 3");
    }
    if (vertex_count == 0) {
        return Error::index_region_not_found("Vertex count is zero");
    }

    const size_t min_bytes = static_cast<size_t>(index_count) * 2;
    if (region.size() < min_bytes) {
        return Error::index_region_not_found(
            "Region of " + std::to_string(region.size()) + " bytes cannot hold " +
            std::to_string(index_count) + " indices");
    }

    const size_t step = options_.step == 0 ? 1 : options_.step;
    const size_t last_start = region.size() - min_bytes;
    size_t windows = 0;

    WindowCounter counter16(region, 16, vertex_count, index_count);
    WindowCounter counter32(region, 32, vertex_count, index_count);

    for (size_t start = 0; start <= last_start; start += step) {
        if (++windows > options_.max_windows) {
            if (logger) {
                LOG_DEBUG(*logger, "IndexLocator", "Window limit " << options_.max_windows << " reached");
            }
            break;
        }

        bool valid16 = counter16.valid_at(start);
        bool valid32 = counter32.valid_at(start);

        if (valid16 || valid32) {
            unsigned width = valid16 ? 16 : 32;
            if (logger) {
                LOG_DEBUG(*logger, "IndexLocator", "Index array at +0x" << std::hex << start << std::dec
                          << ", " << width << "-bit, " << index_count << " indices");
            }
            IndexRegion found;
            found.offset = start;
            found.width = width;
            found.indices = read_indices(region, start, width, index_count);
            return found;
        }
    }

    return Error::index_region_not_found(
        "No " + std::to_string(index_count) + "-index window below vertex count " +
        std::to_string(vertex_count) + " in " + std::to_string(region.size()) + " bytes");
}

} // namespace skymesh
