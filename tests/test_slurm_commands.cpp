#include <gtest/gtest.h>
#include <clusterlink/managers/slurm_commands.hpp>

using namespace clusterlink;

// ── Command builders ─────────────────────────────────────────

TEST(SlurmCommands, Prefix) {
    EXPECT_EQ(build_command("squeue"), "source /etc/profile && module load slurm/alpine && squeue");
}

TEST(SlurmCommands, SqueueBatch) {
    auto cmd = squeue_batch_command({"111", "222"});
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_EQ(cmd.value, "source /etc/profile && module load slurm/alpine && "
                         "squeue -j 111,222 --noheader --format='%i|%j|%t|%M|%L|%D|%C|%m|%P|%Z'");
}

TEST(SlurmCommands, SacctBatch) {
    auto cmd = sacct_batch_command({"333"});
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_NE(cmd.value.find("sacct -j 333 --allocations --noheader --parsable2 "
                             "--format=JobID,JobName,State,ExitCode,Start,End,Elapsed,WorkDir"),
              std::string::npos);
}

TEST(SlurmCommands, RejectsUnsafeIds) {
    EXPECT_TRUE(squeue_batch_command({"111", "1; rm -rf ~"}).is_err());
    EXPECT_TRUE(sacct_batch_command({}).is_err());
    EXPECT_TRUE(cancel_command("$(id)").is_err());
}

TEST(SlurmCommands, Submit) {
    auto cmd = submit_command("/scratch/alpine/u/namdrunner_jobs/j1", "job.sbatch");
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_EQ(cmd.value, "source /etc/profile && module load slurm/alpine && "
                         "cd '/scratch/alpine/u/namdrunner_jobs/j1' && sbatch 'job.sbatch'");
    EXPECT_TRUE(submit_command("relative", "job.sbatch").is_err());
    EXPECT_TRUE(submit_command("/scratch/x", "../job.sbatch").is_err());
}

TEST(SlurmCommands, Cancel) {
    auto cmd = cancel_command("12345678");
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_EQ(cmd.value, "source /etc/profile && module load slurm/alpine && scancel 12345678");
}

// ── State mapping ────────────────────────────────────────────

TEST(SlurmCommands, MapStates) {
    EXPECT_EQ(map_slurm_state("PD").value, JobState::Pending);
    EXPECT_EQ(map_slurm_state("R").value, JobState::Running);
    EXPECT_EQ(map_slurm_state("CG").value, JobState::Running);
    EXPECT_EQ(map_slurm_state("COMPLETED").value, JobState::Completed);
    EXPECT_EQ(map_slurm_state("TIMEOUT").value, JobState::Failed);
    EXPECT_EQ(map_slurm_state("OUT_OF_MEMORY").value, JobState::Failed);
    EXPECT_EQ(map_slurm_state("CANCELLED by 1234").value, JobState::Cancelled);
    EXPECT_EQ(map_slurm_state("CANCELLED+").value, JobState::Cancelled);
    EXPECT_EQ(map_slurm_state("running").value, JobState::Running);
}

TEST(SlurmCommands, MapsHoldAndTransitionalStates) {
    EXPECT_EQ(map_slurm_state("RH").value, JobState::Pending);
    EXPECT_EQ(map_slurm_state("REQUEUE_FED").value, JobState::Pending);
    EXPECT_EQ(map_slurm_state("RD").value, JobState::Pending);
    EXPECT_EQ(map_slurm_state("RS").value, JobState::Running);
    EXPECT_EQ(map_slurm_state("SI").value, JobState::Running);
    EXPECT_EQ(map_slurm_state("SO").value, JobState::Running);
    EXPECT_EQ(map_slurm_state("ST").value, JobState::Running);
    EXPECT_EQ(map_slurm_state("SE").value, JobState::Failed);
    EXPECT_EQ(map_slurm_state("REVOKED").value, JobState::Cancelled);
}

TEST(SlurmCommands, UnknownStateIsProtocolError) {
    auto r = map_slurm_state("WIBBLE");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Protocol);
    EXPECT_EQ(r.error.details, "WIBBLE");
}

// ── Parsing ──────────────────────────────────────────────────

TEST(SlurmCommands, ParseSqueueLine) {
    auto r = parse_squeue_line(
        "12345678|test_job|R|00:15:30|01:44:30|1|24|16GB|amilan|"
        "/scratch/alpine/testuser/namdrunner_jobs/test_job");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.job_id, "12345678");
    EXPECT_EQ(r.value.job_name, "test_job");
    EXPECT_EQ(r.value.state, JobState::Running);
    EXPECT_EQ(r.value.raw_state, "R");
    EXPECT_EQ(r.value.time_used, "00:15:30");
    EXPECT_EQ(r.value.time_left, "01:44:30");
    EXPECT_EQ(r.value.node_count, "1");
    EXPECT_EQ(r.value.cpu_count, "24");
    EXPECT_EQ(r.value.memory, "16GB");
    EXPECT_EQ(r.value.partition, "amilan");
    EXPECT_EQ(r.value.working_directory, "/scratch/alpine/testuser/namdrunner_jobs/test_job");
    EXPECT_EQ(r.value.source, JobStatusRecord::Source::Active);
}

TEST(SlurmCommands, ParseSacctLine) {
    auto r = parse_sacct_line(
        "12345678|test_job|COMPLETED|0:0|2025-01-15T10:00:00|2025-01-15T11:00:00|01:00:00|"
        "/scratch/alpine/testuser/namdrunner_jobs/test_job");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.job_id, "12345678");
    EXPECT_EQ(r.value.state, JobState::Completed);
    EXPECT_EQ(r.value.exit_code, "0:0");
    EXPECT_EQ(r.value.start_time, "2025-01-15T10:00:00");
    EXPECT_EQ(r.value.end_time, "2025-01-15T11:00:00");
    EXPECT_EQ(r.value.elapsed, "01:00:00");
    EXPECT_EQ(r.value.source, JobStatusRecord::Source::Historical);
}

TEST(SlurmCommands, TrailingPipeTolerated) {
    EXPECT_TRUE(parse_sacct_line("1|j|FAILED|1:0|a|b|c|/w|").is_ok());
}

TEST(SlurmCommands, WrongFieldCountKeepsRawLine) {
    auto r = parse_squeue_line("123|job|R");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Protocol);
    EXPECT_EQ(r.error.details, "123|job|R");
}

TEST(SlurmCommands, SacctOutputSkipsSteps) {
    auto r = parse_sacct_output(
        "100|a|COMPLETED|0:0|s|e|00:01:00|/w\n"
        "100.batch|batch|COMPLETED|0:0|s|e|00:01:00|\n"
        "100.extern|extern|COMPLETED|0:0|s|e|00:01:00|\n"
        "\n"
        "101|b|FAILED|1:0|s|e|00:02:00|/w\n");
    EXPECT_TRUE(r.rejected.empty());
    ASSERT_EQ(r.records.size(), 2u);
    EXPECT_EQ(r.records[0].job_id, "100");
    EXPECT_EQ(r.records[1].state, JobState::Failed);
}

TEST(SlurmCommands, BadLinesRejectOnlyThemselves) {
    auto r = parse_squeue_output(
        "1|a|R|0|0|1|1|1G|p|/w\n"
        "2|b|XX|0|0|1|1|1G|p|/w\n"
        "garbage\n"
        "3|c|PD|0|0|1|1|1G|p|/w\n");
    ASSERT_EQ(r.records.size(), 2u);
    EXPECT_EQ(r.records[0].job_id, "1");
    EXPECT_EQ(r.records[1].job_id, "3");

    ASSERT_EQ(r.rejected.size(), 2u);
    EXPECT_EQ(r.rejected[0].job_id, "2");
    EXPECT_EQ(r.rejected[0].error.kind, ErrorKind::Protocol);
    EXPECT_EQ(r.rejected[0].error.details, "2|b|XX|0|0|1|1|1G|p|/w");
    EXPECT_EQ(r.rejected[1].job_id, "garbage");
    EXPECT_EQ(r.rejected[1].error.details, "garbage");
}

TEST(SlurmCommands, ParseSbatch) {
    EXPECT_EQ(parse_sbatch_output("Submitted batch job 12345678\n").value_or(""), "12345678");
    EXPECT_FALSE(parse_sbatch_output("sbatch: error: Batch job submission failed").has_value());
    EXPECT_FALSE(parse_sbatch_output("Submitted batch job ").has_value());
}

TEST(SlurmCommands, ResponseClassifiers) {
    EXPECT_TRUE(is_invalid_job_id_response("slurm_load_jobs error: Invalid job id specified"));
    EXPECT_TRUE(is_cancel_noop_response("scancel: error: Kill job error on job id 5: "
                                        "Job/step already completing or completed"));
    EXPECT_FALSE(is_cancel_noop_response("scancel: error: Access/permission denied"));
}
