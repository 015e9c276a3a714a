#pragma once

#include <gmock/gmock.h>
#include "anchor/anchor_registry.hpp"

class MockAnchorRegistry : public merkseal::AnchorRegistry {
public:
    MOCK_METHOD(merkseal::AnchoredBatch, getBatch, (uint64_t batchId), (override));
};
