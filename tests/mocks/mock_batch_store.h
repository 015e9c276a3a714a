#pragma once

#include <gmock/gmock.h>
#include "batch/batch_store.hpp"
#include <string>
#include <vector>

// Real store whose blob reads are observable. Calls pass through to disk
// unless a test overrides them.
class MockBatchStore : public merkseal::BatchStore {
public:
    MockBatchStore(const std::string& root, merkseal::BatchIdAllocator& ids)
        : merkseal::BatchStore(root, merkseal::HashScheme::Legacy, ids) {
        ON_CALL(*this, loadFiles).WillByDefault([this](uint64_t id) {
            return merkseal::BatchStore::loadFiles(id);
        });
    }

    MOCK_METHOD(std::vector<merkseal::BatchFile>, loadFiles, (uint64_t batchId), (const, override));
};
