#include <gtest/gtest.h>

#include "ChunkCodec.h"
#include "StateFile.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>

using namespace RelayPipe;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class StateFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("relaypipe_state_test_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        path_ = (dir_ / "nested" / "state.db").string();

        now_ = std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());
        auto clock = now_;
        store_ = std::make_unique<ChannelStore>(ChannelStoreOptions(), [clock]() { return *clock; });
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static Chunk chunk(const std::string& payload, uint64_t index, bool final = false) {
        auto c = ChunkCodec::makePlainChunk(std::vector<uint8_t>(payload.begin(), payload.end()), index);
        c.producerId = "writer";
        if (!final) {
            c.flags = 0;
        }
        return c;
    }

    fs::path dir_;
    std::string path_;
    std::shared_ptr<std::chrono::steady_clock::time_point> now_;
    std::unique_ptr<ChannelStore> store_;
};

TEST_F(StateFileTest, MissingFileLoadsEmpty) {
    StateFile state(path_);
    auto loaded = state.load();
    ASSERT_TRUE(loaded.ok());
    EXPECT_TRUE(loaded->empty());
    EXPECT_FALSE(fs::exists(path_));
    EXPECT_TRUE(state.clear().ok());
}

TEST_F(StateFileTest, SaveAndLoadRestoresChannels) {
    ASSERT_TRUE(store_->push("alpha", "", chunk("one", 0)).ok());
    ASSERT_TRUE(store_->push("alpha", "", chunk("two", 1, true)).ok());
    ASSERT_TRUE(store_->push("beta", "secret-credential", chunk("b", 0), "", 120).ok());
    *now_ += 7s;

    {
        StateFile state(path_);
        ASSERT_TRUE(state.save(store_->snapshotAll()).ok());
    }
    EXPECT_TRUE(fs::exists(path_));

    StateFile state(path_);
    auto loaded = state.load();
    ASSERT_TRUE(loaded.ok()) << loaded.error().toString();
    ASSERT_EQ(loaded->size(), 2u);

    const auto& alpha = (*loaded)[0];
    EXPECT_EQ(alpha.name, "alpha");
    ASSERT_EQ(alpha.chunks.size(), 2u);
    EXPECT_EQ(alpha.chunks[1].sequence, 1u);
    EXPECT_TRUE(alpha.chunks[1].isFinal());
    EXPECT_TRUE(alpha.finalQueued);
    EXPECT_EQ(alpha.nextSequence, 2u);
    EXPECT_EQ(alpha.idleSec, 7);
    EXPECT_TRUE(alpha.credentialHash.empty());
    ASSERT_EQ(alpha.producers.size(), 1u);
    EXPECT_EQ(alpha.producers[0].id, "writer");
    EXPECT_EQ(alpha.producers[0].lastIndex, 1u);

    const auto& beta = (*loaded)[1];
    EXPECT_EQ(beta.name, "beta");
    EXPECT_FALSE(beta.credentialHash.empty());
    EXPECT_EQ(beta.ttlSec, 120);

    ChannelStore restored;
    EXPECT_EQ(restored.restore(*loaded), 2u);

    auto first = restored.pop("alpha", "", "reader");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(std::string(first->chunk.payload.begin(), first->chunk.payload.end()), "one");

    EXPECT_EQ(restored.pop("beta", "", "reader").error().code, ErrorCode::AuthError);
    EXPECT_TRUE(restored.pop("beta", "secret-credential", "reader").ok());
}

TEST_F(StateFileTest, SaveReplacesPreviousContents) {
    StateFile state(path_);
    ASSERT_TRUE(store_->push("first", "", chunk("a", 0)).ok());
    ASSERT_TRUE(state.save(store_->snapshotAll()).ok());

    ASSERT_TRUE(store_->clear("first", "").ok());
    ASSERT_TRUE(store_->push("second", "", chunk("b", 0)).ok());
    ASSERT_TRUE(state.save(store_->snapshotAll()).ok());

    auto loaded = state.load();
    ASSERT_TRUE(loaded.ok());
    ASSERT_EQ(loaded->size(), 1u);
    EXPECT_EQ((*loaded)[0].name, "second");
}

TEST_F(StateFileTest, ClearDropsSavedChannels) {
    StateFile state(path_);
    ASSERT_TRUE(store_->push("gone", "", chunk("x", 0)).ok());
    ASSERT_TRUE(state.save(store_->snapshotAll()).ok());

    ASSERT_TRUE(state.clear().ok());
    auto loaded = state.load();
    ASSERT_TRUE(loaded.ok());
    EXPECT_TRUE(loaded->empty());
}

TEST_F(StateFileTest, NotADatabaseIsStorageError) {
    fs::create_directories(fs::path(path_).parent_path());
    {
        std::ofstream out(path_, std::ios::binary);
        out << std::string(4096, 'z');
    }

    StateFile state(path_);
    auto loaded = state.load();
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.error().code, ErrorCode::StorageError);
}
