#pragma once

#include <gmock/gmock.h>
#include "transfer/relay_transport.hpp"

#include <cstddef>
#include <string>
#include <vector>

class MockRelayTransport : public quickshare::transfer::RelayTransport {
public:
    MOCK_METHOD(quickshare::relay::CreateCodeResult, createCode,
                (const quickshare::relay::CreateCodeRequest& request), (override));
    MOCK_METHOD(void, storeEncryptedKey,
                (const std::string& lookupCode, const std::vector<std::byte>& wrappedKey), (override));
    MOCK_METHOD(std::string, uploadChunk,
                (const std::string& lookupCode, std::size_t index, const std::vector<std::byte>& data),
                (override));
    MOCK_METHOD(void, uploadComplete,
                (const std::string& lookupCode, const quickshare::relay::UploadManifest& manifest),
                (override));
    MOCK_METHOD(quickshare::relay::KeyFetch, fetchEncryptedKey, (const std::string& lookupCode),
                (override));
    MOCK_METHOD(quickshare::relay::FileInfo, fetchFileInfo, (const std::string& lookupCode),
                (override));
    MOCK_METHOD(quickshare::relay::ChunkBatch, downloadChunks,
                (const std::string& lookupCode, const std::vector<std::size_t>& indices,
                 const std::string& sessionId),
                (override));
    MOCK_METHOD(quickshare::relay::DownloadCompletion, downloadComplete,
                (const std::string& lookupCode, const std::string& sessionId), (override));
    MOCK_METHOD(std::vector<std::string>, invalidateFile, (const std::string& fileId), (override));
    MOCK_METHOD(quickshare::relay::CodeStatusView, status, (const std::string& lookupCode),
                (override));

    /// Forward every call to @p real unless a test sets its own expectation.
    void delegateTo(quickshare::transfer::RelayTransport& real) {
        using namespace ::testing;
        ON_CALL(*this, createCode).WillByDefault([&real](const auto& r) { return real.createCode(r); });
        ON_CALL(*this, storeEncryptedKey).WillByDefault([&real](const auto& c, const auto& k) {
            real.storeEncryptedKey(c, k);
        });
        ON_CALL(*this, uploadChunk).WillByDefault([&real](const auto& c, std::size_t i, const auto& d) {
            return real.uploadChunk(c, i, d);
        });
        ON_CALL(*this, uploadComplete).WillByDefault([&real](const auto& c, const auto& m) {
            real.uploadComplete(c, m);
        });
        ON_CALL(*this, fetchEncryptedKey).WillByDefault([&real](const auto& c) {
            return real.fetchEncryptedKey(c);
        });
        ON_CALL(*this, fetchFileInfo).WillByDefault([&real](const auto& c) { return real.fetchFileInfo(c); });
        ON_CALL(*this, downloadChunks).WillByDefault([&real](const auto& c, const auto& i, const auto& s) {
            return real.downloadChunks(c, i, s);
        });
        ON_CALL(*this, downloadComplete).WillByDefault([&real](const auto& c, const auto& s) {
            return real.downloadComplete(c, s);
        });
        ON_CALL(*this, invalidateFile).WillByDefault([&real](const auto& f) { return real.invalidateFile(f); });
        ON_CALL(*this, status).WillByDefault([&real](const auto& c) { return real.status(c); });
    }
};
