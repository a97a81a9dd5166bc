#include <gtest/gtest.h>
#include <managers/checkpoint_store.hpp>
#include <core/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class CheckpointStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path state_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("chunkpoint_store_") + info->name());
        fs::remove_all(test_dir);
        state_dir = test_dir / "state";
        set_log_path((test_dir / "debug.log").string());
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    StoreOptions fast_locks() {
        StoreOptions options;
        options.lock_timeout_ms = 100;
        options.lock_poll_ms = 5;
        return options;
    }

    static void write_raw(const fs::path& p, const std::string& content) {
        std::ofstream(p, std::ios::trunc) << content;
    }

    static std::string read_raw(const fs::path& p) {
        std::ifstream in(p);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static ChunkResult result_for(int idx) {
        ChunkResult c;
        c.chunk_index = idx;
        c.input_chars = 100 + idx;
        c.output_chars = 50 + idx;
        c.input_tokens = 30;
        c.output_tokens = 20;
        c.cost = 0.1;
        c.model = "m";
        c.provider = "p";
        c.output = "chunk " + std::to_string(idx) + " output";
        return c;
    }

    // Create a processing job and checkpoint `done` completed chunks one by one.
    JobRecord seed(CheckpointStore& store, const std::string& id, int total, int done) {
        auto created = store.create_new(id, "seeded", total, {{"model", "m"}});
        EXPECT_TRUE(created.is_ok()) << created.error;
        JobRecord r = created.value;
        for (int i = 0; i < done; ++i) {
            auto written = store.write(with_chunk_result(r, result_for(i)));
            EXPECT_TRUE(written.is_ok()) << written.error;
            r = written.value;
        }
        return r;
    }
};

TEST_F(CheckpointStoreTest, ReadMissingIsNotFound) {
    CheckpointStore store(state_dir);
    auto r = store.read("nothing-here");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotFound);
}

TEST_F(CheckpointStoreTest, WriteThenReadRoundTrips) {
    CheckpointStore store(state_dir);
    auto created = store.create_new("job-a", "report", 3, {{"model", "m"}, {"overlap", "200"}}, 0.75);
    ASSERT_TRUE(created.is_ok()) << created.error;

    ChunkResult tricky = result_for(1);
    tricky.output = "line one\nline two: with colon\n  - not a list\n\"quoted\" # not a comment";
    tricky.cost = 0.1 + 0.2;

    JobRecord next = with_chunk_result(created.value, tricky);
    next = with_chunk_failure(next, 2, "RateLimited: retry later");
    auto written = store.write(next);
    ASSERT_TRUE(written.is_ok()) << written.error;

    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_ok()) << read.error;
    const JobRecord& r = read.value;
    EXPECT_EQ(r.job_id, "job-a");
    EXPECT_EQ(r.name, "report");
    EXPECT_EQ(r.status, JobStatus::Processing);
    EXPECT_EQ(r.total_chunks, 3);
    EXPECT_EQ(r.config.at("overlap"), "200");
    EXPECT_EQ(r.completed_chunks, (std::vector<int>{1}));
    ASSERT_EQ(r.failed_chunks.size(), 1u);
    EXPECT_EQ(r.failed_chunks.at(2), "RateLimited: retry later");
    ASSERT_EQ(r.results.size(), 1u);
    EXPECT_EQ(r.results[0].output, tricky.output);
    EXPECT_EQ(r.results[0].cost, tricky.cost);
    EXPECT_EQ(r.results[0].input_chars, tricky.input_chars);
    EXPECT_DOUBLE_EQ(r.estimated_cost, 0.75);
    EXPECT_EQ(r.actual_cost, tricky.cost);
    EXPECT_EQ(r.created_at, created.value.created_at);
    EXPECT_EQ(r.last_updated, written.value.last_updated);
}

TEST_F(CheckpointStoreTest, SecondWriteKeepsPreviousAsBackup) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 4, 1);
    EXPECT_TRUE(fs::exists(store.backup_path("job-a")));

    // The backup holds the record as it was before the last write.
    fs::remove(store.primary_path("job-a"));
    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_ok()) << read.error;
    EXPECT_TRUE(read.value.completed_chunks.empty());
}

TEST_F(CheckpointStoreTest, CorruptPrimaryFallsBackToBackup) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 5, 3);

    write_raw(store.primary_path("job-a"), "job_id: [this is not\n  valid");

    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_ok()) << read.error;
    EXPECT_EQ(read.value.completed_chunks, (std::vector<int>{0, 1}));

    // Next write restores a valid primary without touching the good backup.
    std::string backup_before = read_raw(store.backup_path("job-a"));
    auto written = store.write(with_chunk_result(read.value, result_for(2)));
    ASSERT_TRUE(written.is_ok()) << written.error;
    EXPECT_EQ(read_raw(store.backup_path("job-a")), backup_before);

    auto again = store.read("job-a");
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value.completed_chunks, (std::vector<int>{0, 1, 2}));
}

TEST_F(CheckpointStoreTest, PrimaryFailingValidationFallsBack) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 3, 2);

    // Well-formed YAML, structurally impossible record.
    std::string primary = read_raw(store.primary_path("job-a"));
    auto pos = primary.find("total_chunks: 3");
    ASSERT_NE(pos, std::string::npos);
    primary.replace(pos, 15, "total_chunks: 1");
    write_raw(store.primary_path("job-a"), primary);

    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_ok()) << read.error;
    EXPECT_EQ(read.value.total_chunks, 3);
    EXPECT_EQ(read.value.completed_chunks, (std::vector<int>{0}));
}

TEST_F(CheckpointStoreTest, BothCorruptIsCorruptState) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 3, 1);

    write_raw(store.primary_path("job-a"), "garbage: [");
    write_raw(store.backup_path("job-a"), "");

    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_err());
    EXPECT_EQ(read.kind, ErrorKind::CorruptState);

    EXPECT_FALSE(store.is_resumable("job-a"));
    EXPECT_EQ(store.summarize("job-a").kind, ErrorKind::CorruptState);
}

TEST_F(CheckpointStoreTest, InterruptedWriteLeavesPreviousRecord) {
    CheckpointStore store(state_dir);
    JobRecord r = seed(store, "job-a", 3, 1);

    // A crash mid-write leaves only a partial staging file behind.
    write_raw(store.staging_path("job-a"), "schema_version: 1\njob_id: job-a\nstat");

    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_ok()) << read.error;
    EXPECT_EQ(read.value.completed_chunks, r.completed_chunks);

    auto written = store.write(with_chunk_result(read.value, result_for(1)));
    ASSERT_TRUE(written.is_ok()) << written.error;
    EXPECT_FALSE(fs::exists(store.staging_path("job-a")));
}

TEST_F(CheckpointStoreTest, RecordForAnotherJobIsRejected) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 2, 0);
    fs::copy_file(store.primary_path("job-a"), store.primary_path("job-b"));

    auto read = store.read("job-b");
    ASSERT_TRUE(read.is_err());
    EXPECT_EQ(read.kind, ErrorKind::CorruptState);
}

TEST_F(CheckpointStoreTest, InvalidRecordIsNeverWritten) {
    CheckpointStore store(state_dir);
    JobRecord r = seed(store, "job-a", 2, 1);
    std::string before = read_raw(store.primary_path("job-a"));

    r.completed_chunks.push_back(7);
    auto written = store.write(r);
    ASSERT_TRUE(written.is_err());
    EXPECT_EQ(written.kind, ErrorKind::Internal);
    EXPECT_EQ(read_raw(store.primary_path("job-a")), before);
}

TEST_F(CheckpointStoreTest, LastUpdatedNeverDecreases) {
    CheckpointStore store(state_dir);
    JobRecord r = seed(store, "job-a", 3, 0);

    r.last_updated = "2999-01-01T00:00:00.000Z";
    auto future = store.write(r);
    ASSERT_TRUE(future.is_ok()) << future.error;

    JobRecord stale = with_chunk_result(r, result_for(0));
    stale.last_updated = "2000-01-01T00:00:00.000Z";
    auto written = store.write(stale);
    ASSERT_TRUE(written.is_ok()) << written.error;
    EXPECT_GE(written.value.last_updated, future.value.last_updated);

    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_ok());
    EXPECT_EQ(read.value.last_updated, written.value.last_updated);
}

TEST_F(CheckpointStoreTest, ClampSeesWritesFromAnotherStore) {
    CheckpointStore store(state_dir);
    JobRecord r = seed(store, "job-a", 3, 1);

    // The primary changes behind this store's back.
    CheckpointStore other(state_dir);
    JobRecord ahead = r;
    ahead.last_updated = "2999-01-01T00:00:00.000Z";
    auto future = other.write(ahead);
    ASSERT_TRUE(future.is_ok()) << future.error;

    JobRecord stale = with_chunk_result(r, result_for(1));
    stale.last_updated = "2000-01-01T00:00:00.000Z";
    auto written = store.write(stale);
    ASSERT_TRUE(written.is_ok()) << written.error;
    EXPECT_GE(written.value.last_updated, future.value.last_updated);

    // The other store's primary was valid, so it became the backup.
    EXPECT_NE(read_raw(store.backup_path("job-a")).find("2999-01-01"), std::string::npos);
}

TEST_F(CheckpointStoreTest, NonUtf8OutputSurvivesRoundTrip) {
    CheckpointStore store(state_dir);
    JobRecord r = seed(store, "job-a", 2, 0);

    ChunkResult raw = result_for(0);
    raw.output = std::string("ab\xff\xfe" "cd\x01", 7);
    auto written = store.write(with_chunk_result(r, raw));
    ASSERT_TRUE(written.is_ok()) << written.error;

    // A plain UTF-8 payload next to it stays readable text.
    auto second = store.write(with_chunk_result(written.value, result_for(1)));
    ASSERT_TRUE(second.is_ok()) << second.error;
    EXPECT_NE(read_raw(store.primary_path("job-a")).find("chunk 1 output"), std::string::npos);

    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_ok()) << read.error;
    ASSERT_EQ(read.value.results.size(), 2u);
    EXPECT_EQ(read.value.results[0].output.size(), 7u);
    EXPECT_EQ(read.value.results[0].output, raw.output);
    EXPECT_EQ(read.value.results[1].output, "chunk 1 output");
}

TEST_F(CheckpointStoreTest, CreateNewRefusesActiveJob) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 2, 1);

    auto again = store.create_new("job-a", "again", 2, {});
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::AlreadyExists);

    auto read = store.read("job-a");
    ASSERT_TRUE(read.is_ok());
    EXPECT_EQ(read.value.completed_chunks.size(), 1u);
}

TEST_F(CheckpointStoreTest, CreateNewReplacesCompletedJob) {
    CheckpointStore store(state_dir);
    JobRecord r = seed(store, "job-a", 1, 1);
    ASSERT_TRUE(store.write(with_status(r, JobStatus::Completed)).is_ok());

    auto fresh = store.create_new("job-a", "rerun", 1, {});
    ASSERT_TRUE(fresh.is_ok()) << fresh.error;
    EXPECT_EQ(fresh.value.status, JobStatus::Processing);
    EXPECT_TRUE(fresh.value.completed_chunks.empty());
    EXPECT_EQ(fresh.value.name, "rerun");
}

TEST_F(CheckpointStoreTest, CreateNewPropagatesCorruption) {
    CheckpointStore store(state_dir);
    fs::create_directories(state_dir);
    write_raw(store.primary_path("job-a"), "not: [valid");

    auto created = store.create_new("job-a", "x", 1, {});
    ASSERT_TRUE(created.is_err());
    EXPECT_EQ(created.kind, ErrorKind::CorruptState);
}

TEST_F(CheckpointStoreTest, ClearRemovesEverything) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 3, 2);
    write_raw(store.staging_path("job-a"), "partial");

    ASSERT_TRUE(store.clear("job-a").is_ok());
    EXPECT_FALSE(fs::exists(store.primary_path("job-a")));
    EXPECT_FALSE(fs::exists(store.backup_path("job-a")));
    EXPECT_FALSE(fs::exists(store.staging_path("job-a")));
    EXPECT_EQ(store.read("job-a").kind, ErrorKind::NotFound);
    EXPECT_FALSE(store.is_resumable("job-a"));

    // Clearing an unknown job is not an error.
    EXPECT_TRUE(store.clear("job-a").is_ok());
}

TEST_F(CheckpointStoreTest, ResumableOnlyWhenPausedOrCrashed) {
    CheckpointStore store(state_dir);
    JobRecord r = seed(store, "job-a", 3, 1);
    EXPECT_FALSE(store.is_resumable("job-a"));

    r = store.write(with_status(r, JobStatus::Paused)).value;
    EXPECT_TRUE(store.is_resumable("job-a"));

    r = store.write(with_crash(r, "boom")).value;
    EXPECT_TRUE(store.is_resumable("job-a"));

    store.write(with_status(r, JobStatus::Completed));
    EXPECT_FALSE(store.is_resumable("job-a"));

    EXPECT_FALSE(store.is_resumable("missing"));
}

TEST_F(CheckpointStoreTest, SummarizeReportsProgress) {
    CheckpointStore store(state_dir);
    JobRecord r = seed(store, "job-a", 4, 2);
    store.write(with_chunk_failure(r, 3, "ServerFault: 502"));

    auto s = store.summarize("job-a");
    ASSERT_TRUE(s.is_ok()) << s.error;
    EXPECT_EQ(s.value.completed, 2);
    EXPECT_EQ(s.value.failed, 1);
    EXPECT_EQ(s.value.total, 4);
    EXPECT_DOUBLE_EQ(s.value.progress_pct, 50.0);
    EXPECT_NEAR(s.value.actual_cost, 0.2, 1e-12);
    EXPECT_EQ(s.value.total_input_tokens, 60);

    EXPECT_EQ(store.summarize("missing").kind, ErrorKind::NotFound);
}

TEST_F(CheckpointStoreTest, ListJobs) {
    CheckpointStore store(state_dir);
    seed(store, "job-b", 1, 0);
    seed(store, "job-a", 2, 1);
    fs::rename(store.backup_path("job-a"), store.backup_path("job-c"));
    write_raw(store.staging_path("job-d"), "partial");

    EXPECT_EQ(store.list_jobs(), (std::vector<std::string>{"job-a", "job-b", "job-c"}));
}

TEST_F(CheckpointStoreTest, HeldLockTimesOut) {
    CheckpointStore store(state_dir, fast_locks());
    JobRecord r = seed(store, "job-a", 2, 0);

    FileLock other(store.lock_path("job-a").string());
    ASSERT_TRUE(other.held());

    EXPECT_EQ(store.read("job-a").kind, ErrorKind::LockTimeout);
    EXPECT_EQ(store.write(r).kind, ErrorKind::LockTimeout);
    EXPECT_EQ(store.clear("job-a").kind, ErrorKind::LockTimeout);

    other.release();
    EXPECT_TRUE(store.read("job-a").is_ok());
}

TEST_F(CheckpointStoreTest, RejectsUnsafeJobIds) {
    CheckpointStore store(state_dir);
    EXPECT_EQ(store.read("../escape").kind, ErrorKind::InvalidConfig);
    EXPECT_EQ(store.read(".hidden").kind, ErrorKind::InvalidConfig);
    EXPECT_EQ(store.read("").kind, ErrorKind::InvalidConfig);

    auto claim = store.claim_run("../escape");
    ASSERT_TRUE(claim.is_err());
    EXPECT_EQ(claim.kind, ErrorKind::InvalidConfig);
    EXPECT_FALSE(fs::exists(state_dir.parent_path() / "escape.run.lock"));
}

TEST_F(CheckpointStoreTest, RecoverInterruptedMarksOrphanCrashed) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 3, 1);

    auto recovered = store.recover_interrupted("job-a");
    ASSERT_TRUE(recovered.is_ok()) << recovered.error;
    EXPECT_EQ(recovered.value.status, JobStatus::Crashed);
    EXPECT_FALSE(recovered.value.last_error.empty());
    EXPECT_TRUE(store.is_resumable("job-a"));
}

TEST_F(CheckpointStoreTest, RecoverInterruptedLeavesLiveRunAlone) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 3, 1);

    auto owner = store.claim_run("job-a");
    ASSERT_TRUE(owner.is_ok());
    ASSERT_TRUE(owner.value->held());

    auto recovered = store.recover_interrupted("job-a");
    ASSERT_TRUE(recovered.is_ok());
    EXPECT_EQ(recovered.value.status, JobStatus::Processing);
}

TEST_F(CheckpointStoreTest, WritesJobLog) {
    CheckpointStore store(state_dir);
    seed(store, "job-a", 1, 0);
    EXPECT_NE(read_raw(job_log_path(store.log_dir(), "job-a")).find("created"), std::string::npos);
}
