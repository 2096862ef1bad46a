#include "clinic_relay/gcs_blob_store.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace clinic_relay {
namespace {

using testing::SilentPeer;

TEST(GcsBlobStoreTest, UnresponsiveServerTimesOut) {
    SilentPeer peer;
    GcsBlobStore store("clinic-bucket", "token", "127.0.0.1", peer.port(), 200ms);

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(store.get("patient_profile/P1/patient_info.md"), StorageError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_TRUE(peer.accepted());
}

TEST(GcsBlobStoreTest, StoreStaysUsableAfterTimeout) {
    SilentPeer first;
    GcsBlobStore store("clinic-bucket", "token", "127.0.0.1", first.port(), 200ms);
    EXPECT_THROW(store.exists("patient_profile/P1/a.md"), StorageError);

    // The peer accepts once; the second connection waits in its backlog unanswered.
    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(store.list("patient_profile/"), StorageError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

} // namespace
} // namespace clinic_relay
