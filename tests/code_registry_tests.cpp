#include "relay/code_registry.hpp"
#include "test_clock.h"
#include "utilities/pickup_code.hpp"
#include "utilities/relay_error.hpp"

#include <functional>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace quickshare;
using namespace quickshare::relay;
using namespace std::chrono_literals;

namespace {

const std::string kHash(64, 'a');

void expectError(ErrorCode expected, const std::function<void()> &fn) {
  try {
    fn();
    ADD_FAILURE() << "expected " << errorCodeName(expected);
  } catch (const RelayError &e) {
    EXPECT_EQ(e.code(), expected) << e.what();
  }
}

} // namespace

class CodeRegistryTest : public ::testing::Test {
protected:
  CreateCodeRequest request(const std::string &owner = "alice",
                            std::optional<std::string> hash = std::nullopt) {
    CreateCodeRequest r;
    r.ownerId = owner;
    r.fileName = "report.pdf";
    r.fileSize = 1000;
    r.mimeType = "application/pdf";
    r.contentHash = std::move(hash);
    return r;
  }

  // Issue a code and drive it to the Transferring state.
  CreateCodeResult issueComplete(const std::string &owner = "alice",
                                 std::optional<std::string> hash = std::nullopt) {
    auto created = registry_.createCode(request(owner, hash));
    registry_.markUploadComplete(created.lookupCode, owner, UploadManifest{1, 1000, 65536});
    return created;
  }

  TestClock clock_;
  PickupCodeRegistry registry_{PickupCodeRegistry::Options{}, clock_.fn()};
};

TEST_F(CodeRegistryTest, CreateAppliesDefaults) {
  auto created = registry_.createCode(request());
  EXPECT_FALSE(created.conflict.has_value());
  EXPECT_TRUE(PickupCode::isValidSegment(created.lookupCode));
  EXPECT_EQ(created.fileId.size(), 32u);
  EXPECT_EQ(created.usageLimit, 3u);
  EXPECT_EQ(created.expiresAt, toUnixSeconds(clock_.now() + 24h));
  EXPECT_FALSE(created.reused);

  auto view = registry_.status(created.lookupCode);
  EXPECT_EQ(view.status, CodeStatus::Waiting);
  EXPECT_EQ(view.fileName, "report.pdf");
  EXPECT_EQ(view.usedCount, 0u);
}

TEST_F(CodeRegistryTest, RejectsOutOfRangeOptions) {
  auto r = request();
  r.usageLimit = 0;
  expectError(ErrorCode::InvalidRequest, [&] { registry_.createCode(r); });
  r.usageLimit = 101;
  expectError(ErrorCode::InvalidRequest, [&] { registry_.createCode(r); });
  r.usageLimit = 100;
  r.ttlHours = 169;
  expectError(ErrorCode::InvalidRequest, [&] { registry_.createCode(r); });
  r.ttlHours = 168;
  EXPECT_NO_THROW(registry_.createCode(r));

  expectError(ErrorCode::InvalidRequest,
              [&] { registry_.createCode(request("alice", std::string("not-hex"))); });
  expectError(ErrorCode::InvalidRequest, [&] { registry_.createCode(request("")); });
}

TEST_F(CodeRegistryTest, UnknownCodeIsNotFound) {
  expectError(ErrorCode::CodeNotFound, [&] { registry_.checkAccess("ZZZZZZ"); });
  expectError(ErrorCode::CodeNotFound, [&] { registry_.status("ZZZZZZ"); });
}

TEST_F(CodeRegistryTest, OwnershipEnforced) {
  auto created = registry_.createCode(request("alice"));
  EXPECT_NO_THROW(registry_.requireOwner(created.lookupCode, "alice"));
  expectError(ErrorCode::Forbidden,
              [&] { registry_.requireOwner(created.lookupCode, "mallory"); });
  expectError(ErrorCode::Forbidden, [&] {
    registry_.markUploadComplete(created.lookupCode, "mallory", UploadManifest{1, 1000, 65536});
  });
  expectError(ErrorCode::Forbidden,
              [&] { registry_.invalidateFile(created.fileId, "mallory"); });
}

TEST_F(CodeRegistryTest, ManifestMustMatchDeclaredSize) {
  auto created = registry_.createCode(request());
  expectError(ErrorCode::InvalidRequest, [&] {
    registry_.markUploadComplete(created.lookupCode, "alice", UploadManifest{1, 999, 65536});
  });
}

TEST_F(CodeRegistryTest, DownloadBeforeUploadIsNotReady) {
  auto created = registry_.createCode(request());
  expectError(ErrorCode::KeyNotReady,
              [&] { registry_.recordDownloadComplete(created.lookupCode, ""); });
}

TEST_F(CodeRegistryTest, UsageLimitCompletesCode) {
  auto r = request();
  r.usageLimit = 2;
  auto created = registry_.createCode(r);
  registry_.markUploadComplete(created.lookupCode, "alice", UploadManifest{1, 1000, 65536});

  auto first = registry_.recordDownloadComplete(created.lookupCode, "");
  EXPECT_EQ(first.usedCount, 1u);
  EXPECT_EQ(first.status, CodeStatus::Transferring);

  auto second = registry_.recordDownloadComplete(created.lookupCode, "");
  EXPECT_EQ(second.usedCount, 2u);
  EXPECT_EQ(second.status, CodeStatus::Completed);

  expectError(ErrorCode::CodeCompleted, [&] { registry_.checkAccess(created.lookupCode); });
  expectError(ErrorCode::CodeCompleted,
              [&] { registry_.recordDownloadComplete(created.lookupCode, ""); });
  EXPECT_EQ(registry_.status(created.lookupCode).usedCount, 2u);
}

TEST_F(CodeRegistryTest, SessionsAreTrackedPerCode) {
  auto created = issueComplete();
  std::string session = registry_.openSession(created.lookupCode);
  EXPECT_EQ(session.size(), 32u);
  EXPECT_NO_THROW(registry_.validateSession(created.lookupCode, session));
  EXPECT_NO_THROW(registry_.validateSession(created.lookupCode, ""));
  expectError(ErrorCode::InvalidRequest,
              [&] { registry_.validateSession(created.lookupCode, "bogus"); });

  registry_.recordDownloadComplete(created.lookupCode, session);
  // A session counts once.
  expectError(ErrorCode::InvalidRequest,
              [&] { registry_.recordDownloadComplete(created.lookupCode, session); });
}

TEST_F(CodeRegistryTest, OldestSessionsAreDroppedPastTheCap) {
  PickupCodeRegistry::Options options;
  options.maxSessionsPerCode = 2;
  PickupCodeRegistry capped(options, clock_.fn());
  auto created = capped.createCode(request());
  capped.markUploadComplete(created.lookupCode, "alice", UploadManifest{1, 1000, 65536});

  std::vector<std::string> sessions;
  for (int i = 0; i < 5; ++i) {
    sessions.push_back(capped.openSession(created.lookupCode));
  }
  for (int i = 0; i < 3; ++i) {
    expectError(ErrorCode::InvalidRequest,
                [&] { capped.validateSession(created.lookupCode, sessions[i]); });
  }
  EXPECT_NO_THROW(capped.validateSession(created.lookupCode, sessions[3]));
  EXPECT_NO_THROW(capped.validateSession(created.lookupCode, sessions[4]));

  capped.recordDownloadComplete(created.lookupCode, sessions[4]);
  EXPECT_EQ(capped.status(created.lookupCode).usedCount, 1u);
  expectError(ErrorCode::InvalidRequest,
              [&] { capped.recordDownloadComplete(created.lookupCode, sessions[0]); });
}

TEST_F(CodeRegistryTest, ExpiryIsLazyAndPrecise) {
  auto r = request();
  r.ttlHours = 1;
  auto created = registry_.createCode(r);
  clock_.advance(3599s);
  EXPECT_NO_THROW(registry_.checkAccess(created.lookupCode));
  clock_.advance(1s);
  expectError(ErrorCode::CodeExpired, [&] { registry_.checkAccess(created.lookupCode); });
  EXPECT_EQ(registry_.status(created.lookupCode).status, CodeStatus::Expired);
}

TEST_F(CodeRegistryTest, DuplicateContentReportsLiveUpload) {
  auto first = issueComplete("alice", kHash);
  auto dup = registry_.createCode(request("alice", kHash));
  ASSERT_TRUE(dup.conflict.has_value());
  EXPECT_EQ(dup.conflict->fileId, first.fileId);
  EXPECT_EQ(dup.conflict->lookupCode, first.lookupCode);
  EXPECT_EQ(dup.conflict->expiresAt, first.expiresAt);
  EXPECT_TRUE(dup.lookupCode.empty());

  // Upper-case hash is the same content.
  std::string upper(64, 'A');
  EXPECT_TRUE(registry_.createCode(request("alice", upper)).conflict.has_value());

  // Another owner's identical content is never linked.
  EXPECT_FALSE(registry_.createCode(request("bob", kHash)).conflict.has_value());
}

TEST_F(CodeRegistryTest, DuplicateTracksUnfinishedUploads) {
  auto x = registry_.createCode(request("alice", kHash)); // still uploading

  // A second sender of the same content learns about the pending upload.
  auto y = registry_.createCode(request("alice", kHash));
  ASSERT_TRUE(y.conflict.has_value());
  EXPECT_EQ(y.conflict->fileId, x.fileId);
  EXPECT_EQ(y.conflict->lookupCode, x.lookupCode);
  EXPECT_FALSE(y.conflict->uploadComplete);
  EXPECT_TRUE(y.lookupCode.empty());

  registry_.markUploadComplete(x.lookupCode, "alice", UploadManifest{1, 1000, 65536});
  auto z = registry_.createCode(request("alice", kHash));
  ASSERT_TRUE(z.conflict.has_value());
  EXPECT_EQ(z.conflict->fileId, x.fileId);
  EXPECT_TRUE(z.conflict->uploadComplete);

  // Only after invalidation may the content be shared again, exactly once.
  registry_.invalidateFile(x.fileId, "alice");
  auto fresh = registry_.createCode(request("alice", kHash));
  ASSERT_FALSE(fresh.conflict.has_value());
  auto again = registry_.createCode(request("alice", kHash));
  ASSERT_TRUE(again.conflict.has_value());
  EXPECT_EQ(again.conflict->fileId, fresh.fileId);
}

TEST_F(CodeRegistryTest, DuplicateSkipsExpiredUploads) {
  auto r = request("alice", kHash);
  r.ttlHours = 1;
  auto old = registry_.createCode(r);
  registry_.markUploadComplete(old.lookupCode, "alice", UploadManifest{1, 1000, 65536});
  clock_.advance(2h);

  // The expired file is still on record until the sweep releases it.
  auto renewed = registry_.createCode(request("alice", kHash));
  ASSERT_FALSE(renewed.conflict.has_value());
  auto dup = registry_.createCode(request("alice", kHash));
  ASSERT_TRUE(dup.conflict.has_value());
  EXPECT_EQ(dup.conflict->fileId, renewed.fileId);

  registry_.sweepOwner("alice");
  dup = registry_.createCode(request("alice", kHash));
  ASSERT_TRUE(dup.conflict.has_value());
  EXPECT_EQ(dup.conflict->fileId, renewed.fileId);
}

TEST_F(CodeRegistryTest, FingerprintIsPepperedAndOwnerScoped) {
  PickupCodeRegistry::Options other;
  other.pepper = "another-pepper";
  PickupCodeRegistry otherRegistry(other, clock_.fn());

  const auto fp = registry_.fingerprint("alice", kHash);
  EXPECT_EQ(fp.size(), 64u);
  EXPECT_EQ(fp, registry_.fingerprint("alice", std::string(64, 'A')));
  EXPECT_NE(fp, registry_.fingerprint("bob", kHash));
  EXPECT_NE(fp, otherRegistry.fingerprint("alice", kHash));
  EXPECT_NE(fp, kHash);
}

TEST_F(CodeRegistryTest, ReuseSharesStorageAndCapsExpiry) {
  auto r = request("alice", kHash);
  r.ttlHours = 2;
  auto original = registry_.createCode(r);
  registry_.markUploadComplete(original.lookupCode, "alice", UploadManifest{1, 1000, 65536});
  clock_.advance(1h);

  auto reuse = request("alice");
  reuse.reuseFileId = original.fileId;
  reuse.ttlHours = 24;
  auto again = registry_.createCode(reuse);
  ASSERT_FALSE(again.conflict.has_value());
  EXPECT_TRUE(again.reused);
  EXPECT_EQ(again.fileId, original.fileId);
  EXPECT_NE(again.lookupCode, original.lookupCode);
  // Capped at the stored chunks' expiry, not now + 24h.
  EXPECT_EQ(again.expiresAt, original.expiresAt);

  auto record = registry_.checkAccess(again.lookupCode);
  EXPECT_EQ(record.storageCode, original.lookupCode);
  EXPECT_EQ(record.status, CodeStatus::Transferring);
  EXPECT_EQ(record.fileName, "report.pdf");
}

TEST_F(CodeRegistryTest, ReuseRequiresOwnedCompleteFile) {
  auto incomplete = registry_.createCode(request("alice"));
  auto reuse = request("alice");
  reuse.reuseFileId = incomplete.fileId;
  expectError(ErrorCode::InvalidRequest, [&] { registry_.createCode(reuse); });

  reuse.ownerId = "bob";
  expectError(ErrorCode::Forbidden, [&] { registry_.createCode(reuse); });

  reuse.reuseFileId = "0123456789abcdef0123456789abcdef";
  expectError(ErrorCode::CodeNotFound, [&] { registry_.createCode(reuse); });
}

TEST_F(CodeRegistryTest, ReuseOfSweptFileIsNotFound) {
  auto r = request();
  r.ttlHours = 1;
  auto created = registry_.createCode(r);
  registry_.markUploadComplete(created.lookupCode, "alice", UploadManifest{1, 1000, 65536});
  clock_.advance(26h);
  registry_.sweepOwner("alice");

  auto reuse = request();
  reuse.reuseFileId = created.fileId;
  expectError(ErrorCode::CodeNotFound, [&] { registry_.createCode(reuse); });
}

TEST_F(CodeRegistryTest, ReuseRacingSweepFailsCleanly) {
  constexpr int kFiles = 200;
  std::vector<std::string> fileIds;
  for (int i = 0; i < kFiles; ++i) {
    auto r = request();
    r.ttlHours = 1;
    auto created = registry_.createCode(r);
    registry_.markUploadComplete(created.lookupCode, "alice", UploadManifest{1, 1000, 65536});
    fileIds.push_back(created.fileId);
  }
  clock_.advance(26h);

  std::vector<std::string> unexpected;
  std::thread reuser([&] {
    for (const auto &fileId : fileIds) {
      auto reuse = request();
      reuse.reuseFileId = fileId;
      try {
        registry_.createCode(reuse);
        unexpected.push_back(fileId + ": reused");
      } catch (const RelayError &e) {
        if (e.code() != ErrorCode::CodeNotFound && e.code() != ErrorCode::CodeExpired &&
            e.code() != ErrorCode::CodeInvalidated) {
          unexpected.push_back(fileId + ": " + errorCodeName(e.code()));
        }
      } catch (const std::exception &e) {
        unexpected.push_back(fileId + ": " + e.what());
      }
    }
  });
  registry_.sweepOwner("alice");
  reuser.join();
  EXPECT_EQ(unexpected, std::vector<std::string>{});
}

TEST_F(CodeRegistryTest, InvalidateMarksEveryCode) {
  auto original = issueComplete();
  auto reuse = request();
  reuse.reuseFileId = original.fileId;
  auto second = registry_.createCode(reuse);

  auto codes = registry_.invalidateFile(original.fileId, "alice");
  EXPECT_EQ(codes.size(), 2u);
  expectError(ErrorCode::CodeInvalidated, [&] { registry_.checkAccess(original.lookupCode); });
  expectError(ErrorCode::CodeInvalidated, [&] { registry_.checkAccess(second.lookupCode); });

  reuse.reuseFileId = original.fileId;
  expectError(ErrorCode::CodeInvalidated, [&] { registry_.createCode(reuse); });
}

TEST_F(CodeRegistryTest, SweepRevokesKeysAndReleasesStorage) {
  auto r = request();
  r.usageLimit = 1;
  auto created = registry_.createCode(r);
  registry_.markUploadComplete(created.lookupCode, "alice", UploadManifest{1, 1000, 65536});
  registry_.recordDownloadComplete(created.lookupCode, "");

  SweepReport report = registry_.sweepOwner("alice");
  EXPECT_EQ(report.revokedKeyCodes.count(created.lookupCode), 1u);
  EXPECT_EQ(report.releasedStorageCodes.count(created.lookupCode), 1u);
  EXPECT_EQ(report.droppedRecords, 0u);

  // Decisions are reported once.
  SweepReport again = registry_.sweepOwner("alice");
  EXPECT_TRUE(again.revokedKeyCodes.empty());
  EXPECT_TRUE(again.releasedStorageCodes.empty());
}

TEST_F(CodeRegistryTest, TombstonesOutliveExpiryThenDrop) {
  auto r = request();
  r.ttlHours = 1;
  auto created = registry_.createCode(r);

  clock_.advance(2h);
  SweepReport report = registry_.sweepOwner("alice");
  EXPECT_EQ(report.expiredCodes, 1u);
  EXPECT_EQ(report.droppedRecords, 0u);
  // Still answers with the precise reason.
  expectError(ErrorCode::CodeExpired, [&] { registry_.checkAccess(created.lookupCode); });

  clock_.advance(24h);
  report = registry_.sweepOwner("alice");
  EXPECT_EQ(report.droppedRecords, 2u); // code and file
  expectError(ErrorCode::CodeNotFound, [&] { registry_.checkAccess(created.lookupCode); });
  EXPECT_TRUE(registry_.owners().empty());
}

TEST_F(CodeRegistryTest, SweepTouchesOnlyOneOwner) {
  auto r = request("alice");
  r.ttlHours = 1;
  auto alice = registry_.createCode(r);
  r.ownerId = "bob";
  auto bob = registry_.createCode(r);
  clock_.advance(2h);

  SweepReport aliceReport = registry_.sweepOwner("alice");
  EXPECT_EQ(aliceReport.expiredCodes, 1u);
  EXPECT_EQ(aliceReport.revokedKeyCodes.count(alice.lookupCode), 1u);
  EXPECT_EQ(aliceReport.revokedKeyCodes.count(bob.lookupCode), 0u);

  SweepReport bobReport = registry_.sweepOwner("bob");
  EXPECT_EQ(bobReport.expiredCodes, 1u);
  EXPECT_EQ(bobReport.revokedKeyCodes.count(bob.lookupCode), 1u);
  EXPECT_EQ(registry_.sweepOwner("nobody").expiredCodes, 0u);
}

TEST_F(CodeRegistryTest, ConcurrentOwnersIssueDistinctCodes) {
  constexpr int kOwners = 6;
  constexpr int kPerOwner = 50;
  std::vector<std::vector<std::string>> issued(kOwners);
  std::vector<std::thread> threads;
  for (int o = 0; o < kOwners; ++o) {
    threads.emplace_back([this, o, &issued] {
      for (int i = 0; i < kPerOwner; ++i) {
        auto created = registry_.createCode(request("owner" + std::to_string(o)));
        registry_.sweepOwner("owner" + std::to_string(o));
        issued[o].push_back(created.lookupCode);
      }
    });
  }
  for (auto &t : threads)
    t.join();

  std::set<std::string> all;
  for (const auto &codes : issued)
    all.insert(codes.begin(), codes.end());
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kOwners * kPerOwner));
  EXPECT_EQ(registry_.owners().size(), static_cast<std::size_t>(kOwners));
}
