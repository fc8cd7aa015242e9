// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Fuzz target: coverage record parsing
 *
 * Tests ParseCoverageRecord() on arbitrary lines:
 * - Never throws
 * - Accepted records format back to a line that parses to the same record
 */

#include <test/fuzz/fuzz.h>
#include <test/fuzz/util.h>

#include <exec/line_record_provider.h>

#include <cassert>
#include <string>

FUZZ_TARGET(coverage_record)
{
    InitializeFuzzEnvironment();
    FuzzedDataProvider fuzzed_data(data, size);

    std::string line = fuzzed_data.ConsumeRemainingAsString();

    CCoverageRecord record;
    if (!ParseCoverageRecord(line, record)) {
        return;
    }

    assert(record.kind == 'L' || record.kind == 'B');
    assert(!record.path.empty());
    assert(record.path.find('\t') == std::string::npos);

    std::string formatted = std::string(1, record.kind) + "\t" + record.path + "\t" + std::to_string(record.from);
    if (record.kind == 'B') {
        formatted += "\t" + std::to_string(record.to);
    }

    CCoverageRecord reparsed;
    assert(ParseCoverageRecord(formatted, reparsed));
    assert(reparsed.kind == record.kind);
    assert(reparsed.path == record.path);
    assert(reparsed.from == record.from);
    assert(reparsed.to == record.to);
}
