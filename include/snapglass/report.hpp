#pragma once

#include "diff.hpp"
#include "timeline.hpp"
#include "value.hpp"

#include <ostream>
#include <span>
#include <string>

namespace snapglass {

// Lowercase hex, two digits per byte
std::string hex_string(std::span<const uint8_t> bytes);

// ============================================================================
// Structured form of diff and timeline results
// ============================================================================

Value to_value(const ByteRegion& region);
Value to_value(const ByteSummary& summary);
Value to_value(const WordSummary& summary);
Value to_value(const ResourceDelta& delta);
Value to_value(const InstanceLog& log);

// {resource, schema, stride, tracked, total_changes, instances}
Value to_value(const TimelineReport& report);

// ============================================================================
// Writers
// ============================================================================

void write_timeline_json(std::ostream& out, const TimelineReport& report, bool pretty = false);
void write_timeline_text(std::ostream& out, const TimelineReport& report);

void write_regions_text(std::ostream& out, const std::vector<ByteRegion>& regions);
void write_byte_summary_text(std::ostream& out, const ByteSummary& summary);
void write_word_summary_text(std::ostream& out, const WordSummary& summary);
void write_resource_delta_text(std::ostream& out, const ResourceDelta& delta);

} // namespace snapglass
