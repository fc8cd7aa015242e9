// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <db/fuzz_store.h>
#include <util/logging.h>
#include <util/time.h>

bool CFuzzStore::RecordCrash(const std::string& data, const std::string& stderr_text) {
    CCrashInfo info = ParseCrash(stderr_text);
    bool is_new = UpsertCrash(info, data, FormatISO8601DateTime(GetTime()));

    LogPrintCrash(DEBUG, "%s crash %s at %s:%lld",
                  is_new ? "new" : "duplicate",
                  info.exception_type.c_str(), info.file.c_str(),
                  static_cast<long long>(info.line));
    return is_new;
}
