#include <gtest/gtest.h>
#include <managers/job_record.hpp>

static JobRecord make_record(int total) {
    JobRecord r;
    r.job_id = "job";
    r.name = "test";
    r.status = JobStatus::Processing;
    r.created_at = "2025-01-15T10:00:00.000Z";
    r.last_updated = r.created_at;
    r.total_chunks = total;
    return r;
}

static ChunkResult make_result(int idx, double cost, std::int64_t in_tok, std::int64_t out_tok) {
    ChunkResult c;
    c.chunk_index = idx;
    c.cost = cost;
    c.input_tokens = in_tok;
    c.output_tokens = out_tok;
    c.output = "out" + std::to_string(idx);
    return c;
}

TEST(JobStatusNames, NamesRoundTrip) {
    for (JobStatus s : {JobStatus::Processing, JobStatus::Paused, JobStatus::Completed,
                        JobStatus::Crashed, JobStatus::Idle}) {
        JobStatus parsed;
        ASSERT_TRUE(parse_job_status(job_status_name(s), parsed));
        EXPECT_EQ(parsed, s);
    }
    JobStatus ignored;
    EXPECT_FALSE(parse_job_status("running", ignored));
}

TEST(JobStatusNames, Resumable) {
    EXPECT_TRUE(is_resumable_status(JobStatus::Paused));
    EXPECT_TRUE(is_resumable_status(JobStatus::Crashed));
    EXPECT_FALSE(is_resumable_status(JobStatus::Processing));
    EXPECT_FALSE(is_resumable_status(JobStatus::Completed));
    EXPECT_FALSE(is_resumable_status(JobStatus::Idle));
}

TEST(JobRecord, ChunkResultKeepsOrderAndTotals) {
    JobRecord r = make_record(5);
    r = with_chunk_result(r, make_result(3, 0.5, 10, 20));
    r = with_chunk_result(r, make_result(1, 0.25, 5, 7));

    EXPECT_EQ(r.completed_chunks, (std::vector<int>{1, 3}));
    ASSERT_EQ(r.results.size(), 2u);
    EXPECT_EQ(r.results[0].chunk_index, 1);
    EXPECT_EQ(r.results[1].chunk_index, 3);
    EXPECT_DOUBLE_EQ(r.actual_cost, 0.75);
    EXPECT_EQ(r.total_input_tokens, 15);
    EXPECT_EQ(r.total_output_tokens, 27);
    EXPECT_TRUE(validate_record(r).is_ok());
}

TEST(JobRecord, ChunkResultDoesNotMutateInput) {
    JobRecord r = make_record(2);
    JobRecord next = with_chunk_result(r, make_result(0, 1.0, 1, 1));
    EXPECT_TRUE(r.completed_chunks.empty());
    EXPECT_EQ(next.completed_chunks.size(), 1u);
}

TEST(JobRecord, RepeatedResultReplacesTotals) {
    JobRecord r = make_record(2);
    r = with_chunk_result(r, make_result(0, 1.0, 100, 100));
    r = with_chunk_result(r, make_result(0, 0.5, 40, 60));

    EXPECT_EQ(r.completed_chunks, (std::vector<int>{0}));
    ASSERT_EQ(r.results.size(), 1u);
    EXPECT_DOUBLE_EQ(r.actual_cost, 0.5);
    EXPECT_EQ(r.total_input_tokens, 40);
    EXPECT_EQ(r.total_output_tokens, 60);
}

TEST(JobRecord, FailureStaysPendingAndSuccessClearsIt) {
    JobRecord r = make_record(3);
    r = with_chunk_failure(r, 1, "RateLimited: slow down");

    EXPECT_EQ(r.failed_chunks.size(), 1u);
    EXPECT_EQ(r.pending_chunks(), (std::vector<int>{0, 1, 2}));
    EXPECT_TRUE(validate_record(r).is_ok());

    r = with_chunk_result(r, make_result(1, 0.1, 1, 1));
    EXPECT_TRUE(r.failed_chunks.empty());
    EXPECT_EQ(r.pending_chunks(), (std::vector<int>{0, 2}));
}

TEST(JobRecord, ProgressAndSummary) {
    JobRecord r = make_record(4);
    EXPECT_DOUBLE_EQ(r.progress_pct(), 0.0);
    r = with_chunk_result(r, make_result(0, 0.2, 3, 4));
    r = with_chunk_failure(r, 2, "ServerFault: 503");
    r.estimated_cost = 1.5;

    JobSummary s = summarize_record(r);
    EXPECT_EQ(s.job_id, "job");
    EXPECT_EQ(s.completed, 1);
    EXPECT_EQ(s.failed, 1);
    EXPECT_EQ(s.total, 4);
    EXPECT_DOUBLE_EQ(s.progress_pct, 25.0);
    EXPECT_DOUBLE_EQ(s.estimated_cost, 1.5);
    EXPECT_DOUBLE_EQ(s.actual_cost, 0.2);
    EXPECT_EQ(s.total_input_tokens, 3);
}

TEST(JobRecord, EmptyJobProgress) {
    JobRecord r = make_record(0);
    EXPECT_DOUBLE_EQ(r.progress_pct(), 0.0);
    EXPECT_TRUE(r.pending_chunks().empty());
    EXPECT_TRUE(validate_record(r).is_ok());
}

TEST(JobRecord, CrashKeepsError) {
    JobRecord r = with_crash(make_record(2), "chunk 1: AuthFailure: bad key");
    EXPECT_EQ(r.status, JobStatus::Crashed);
    EXPECT_EQ(r.last_error, "chunk 1: AuthFailure: bad key");
}

TEST(JobRecord, CrashedChunkLeavesFailedSet) {
    JobRecord r = with_chunk_failure(make_record(3), 1, "RateLimited: slow down");
    r = with_chunk_failure(r, 2, "Timeout: no answer");

    JobRecord crashed = with_crash(r, "chunk 1: AuthFailure: bad key", 1);
    EXPECT_EQ(crashed.status, JobStatus::Crashed);
    EXPECT_EQ(crashed.failed_chunks.count(1), 0u);
    EXPECT_EQ(crashed.failed_chunks.count(2), 1u);
    EXPECT_TRUE(validate_record(crashed).is_ok());

    // Job-level errors leave the failed set alone.
    EXPECT_EQ(with_crash(r, "store gone").failed_chunks.size(), 2u);
}

// ── Validation ─────────────────────────────────────────────

TEST(JobRecordValidation, RejectsOutOfRangeCompleted) {
    JobRecord r = make_record(3);
    r.completed_chunks = {0, 3};
    auto v = validate_record(r);
    ASSERT_TRUE(v.is_err());
    EXPECT_EQ(v.kind, ErrorKind::CorruptState);
}

TEST(JobRecordValidation, RejectsUnsortedOrDuplicateCompleted) {
    JobRecord r = make_record(3);
    r.completed_chunks = {1, 1};
    EXPECT_TRUE(validate_record(r).is_err());
    r.completed_chunks = {2, 0};
    EXPECT_TRUE(validate_record(r).is_err());
}

TEST(JobRecordValidation, RejectsOverlapOfCompletedAndFailed) {
    JobRecord r = with_chunk_result(make_record(3), make_result(0, 0, 0, 0));
    r.failed_chunks[0] = "x";
    EXPECT_TRUE(validate_record(r).is_err());
}

TEST(JobRecordValidation, RejectsResultWithoutCompletion) {
    JobRecord r = make_record(3);
    r.results.push_back(make_result(2, 0, 0, 0));
    EXPECT_TRUE(validate_record(r).is_err());
}

TEST(JobRecordValidation, RejectsIdleAndBadSchema) {
    JobRecord idle = make_record(1);
    idle.status = JobStatus::Idle;
    EXPECT_TRUE(validate_record(idle).is_err());

    JobRecord schema = make_record(1);
    schema.schema_version = RECORD_SCHEMA_VERSION + 1;
    EXPECT_TRUE(validate_record(schema).is_err());
}

TEST(JobRecordValidation, RejectsTimeTravel) {
    JobRecord r = make_record(1);
    r.last_updated = "2025-01-14T10:00:00.000Z";
    EXPECT_TRUE(validate_record(r).is_err());
}
