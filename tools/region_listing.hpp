#ifndef NBTCRAFT_TOOLS_REGION_LISTING_HPP
#define NBTCRAFT_TOOLS_REGION_LISTING_HPP

#include <ostream>
#include <sstream>
#include <string>

#include "nbtcraft/error.hpp"
#include "nbtcraft/log.hpp"
#include "nbtcraft/region.hpp"

namespace nbtcraft {
namespace cli {

/// @brief Writes one line per non-empty slot: `x z sector=.. count=.. timestamp=.. entries=N`, or `unreadable` in
/// place of the entry count when the chunk fails to decode. Each line is written whole.
/// @return The number of unreadable chunks.
inline std::size_t list_region_chunks(RegionFile& region, std::ostream& out) {
    std::size_t failures = 0;
    auto chunks = region.iter_nonempty();
    for (auto it = chunks.begin(); it != chunks.end(); ++it) {
        const RegionSlot& slot = region.slot_at(it.slot_index());
        std::ostringstream line;
        line << it.slot_index() % REGION_WIDTH << " " << it.slot_index() / REGION_WIDTH
             << " sector=" << slot.sector_offset << " count=" << static_cast<int>(slot.sector_count)
             << " timestamp=" << slot.timestamp;
        try {
            std::size_t entries = it->nbt().size();
            line << " entries=" << entries;
        } catch (const nbt_error& e) {
            line << " unreadable";
            NBTCRAFT_LOG_ERROR("{}", e.what());
            ++failures;
        }
        out << line.str() << "\n";
    }
    out << region.chunk_count() << " chunks";
    if (failures > 0)
        out << ", " << failures << " unreadable";
    out << "\n";
    return failures;
}

}
}

#endif
