#include <gtest/gtest.h>

#include "file_output.hpp"
#include "file_pipeline.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace RdfClean {
namespace pipeline {
namespace {

using oracle::OracleStatus;
using testing_support::CapturedLog;
using testing_support::FakeOracle;
using testing_support::readFile;
using testing_support::TempDir;
using testing_support::writeFile;

class FilePipelineTest : public ::testing::Test {
protected:
  FilePipelineTest()
      : dir_("pipeline"), logger_(captured_.sink()),
        pipeline_(CleaningConfig{}, true, oracle_, logger_) {}

  const fs::path &root() const { return dir_.path(); }

  EditRecord readChangelog(const fs::path &path) {
    return EditRecord::fromJson(nlohmann::json::parse(readFile(path)));
  }

  TempDir dir_;
  CapturedLog captured_;
  log::Logger logger_;
  FakeOracle oracle_;
  FilePipeline pipeline_;
};

TEST_F(FilePipelineTest, OutputPathsMirrorInputTree) {
  fs::path input = root() / "sub" / "dir" / "data.nt";
  fs::path output = pipeline_.outputPathFor(input, root());
  EXPECT_EQ(output, root() / "rdf_cleaned" / "sub" / "dir" / "data.nt");
  EXPECT_EQ(pipeline_.changelogPathFor(output),
            root() / "rdf_cleaned" / "sub" / "dir" / "data.nt.changelog.json");
}

TEST_F(FilePipelineTest, ValidFileIsCopiedByteForByte) {
  const std::string content = "<a> <b> <c> .\r\n<has space> <p>\n  <o> .\n";
  fs::path input = root() / "valid.ttl";
  writeFile(input, content);
  oracle_.set("valid.ttl", OracleStatus::Valid);

  ProcessingOutcome outcome = pipeline_.processFile(input, root());

  EXPECT_EQ(outcome.kind, OutcomeKind::CopiedUnchanged);
  EXPECT_EQ(outcome.preCheck, OracleStatus::Valid);
  EXPECT_FALSE(outcome.postCheck.has_value());
  EXPECT_TRUE(outcome.record.empty());
  EXPECT_EQ(readFile(outcome.outputPath), content);

  auto doc = nlohmann::json::parse(readFile(outcome.changelogPath));
  EXPECT_EQ(doc["iri_sanitized"]["count"], 0);
  EXPECT_EQ(doc["multiline_merged"]["count"], 0);
  EXPECT_EQ(oracle_.calls.size(), 1u);
}

TEST_F(FilePipelineTest, InvalidFileIsCleanedAndRecorded) {
  fs::path input = root() / "nested" / "broken.nt";
  writeFile(input, "<http://ex.org/a b> <http://ex.org/p> <http://ex.org/o> .\n"
                   "<http://ex.org/s>\n"
                   "    <http://ex.org/p>\n"
                   "    <http://ex.org/x|y> .\n"
                   "<http://ex.org/ok> <http://ex.org/p> \"lit\" .\n");

  ProcessingOutcome outcome = pipeline_.processFile(input, root());

  EXPECT_EQ(outcome.kind, OutcomeKind::CleanedWithEdits);
  EXPECT_EQ(outcome.preCheck, OracleStatus::Invalid);
  EXPECT_FALSE(outcome.danglingTail);
  EXPECT_EQ(readFile(outcome.outputPath),
            "<http://ex.org/a%20b> <http://ex.org/p> <http://ex.org/o> .\n"
            "<http://ex.org/s>     <http://ex.org/p>     "
            "<http://ex.org/x%7Cy> .\n"
            "<http://ex.org/ok> <http://ex.org/p> \"lit\" .\n");

  EditRecord record = readChangelog(outcome.changelogPath);
  EXPECT_EQ(record, outcome.record);
  ASSERT_EQ(record.iriRewrites.size(), 2u);
  EXPECT_EQ(record.iriRewrites[0].line, 1);
  EXPECT_EQ(record.iriRewrites[0].before, "http://ex.org/a b");
  EXPECT_EQ(record.iriRewrites[1].line, 4);
  EXPECT_EQ(record.iriRewrites[1].after, "http://ex.org/x%7Cy");
  ASSERT_EQ(record.mergedStatements.size(), 1u);
  EXPECT_EQ(record.mergedStatements[0].line, 4);
  // Recorded before sanitization
  EXPECT_EQ(record.mergedStatements[0].mergedTriple,
            "<http://ex.org/s>     <http://ex.org/p>     "
            "<http://ex.org/x|y> .");

  // Pre-check on the input, post-check on the cleaned output
  ASSERT_EQ(oracle_.calls.size(), 2u);
  EXPECT_EQ(oracle_.calls[0], input.string());
  EXPECT_EQ(oracle_.calls[1], outcome.outputPath.string());
  ASSERT_TRUE(outcome.postCheck.has_value());
}

TEST_F(FilePipelineTest, InvalidFileWithoutFixableDefects) {
  fs::path input = root() / "other.n3";
  writeFile(input, "<a> <b> \"unterminated .\n");

  ProcessingOutcome outcome = pipeline_.processFile(input, root());

  EXPECT_EQ(outcome.kind, OutcomeKind::CleanedNoEdits);
  EXPECT_TRUE(outcome.record.empty());
  EXPECT_EQ(readFile(outcome.outputPath), "<a> <b> \"unterminated .\n");
}

TEST_F(FilePipelineTest, UnavailableOracleIsTreatedAsInvalid) {
  FakeOracle unavailable(OracleStatus::Unavailable);
  FilePipeline pipeline(CleaningConfig{}, false, unavailable, logger_);

  fs::path input = root() / "unknown.nt";
  writeFile(input, "<a b> <p> <o> .\n");

  ProcessingOutcome outcome = pipeline.processFile(input, root());

  EXPECT_EQ(outcome.preCheck, OracleStatus::Unavailable);
  EXPECT_EQ(outcome.kind, OutcomeKind::CleanedWithEdits);
  EXPECT_EQ(readFile(outcome.outputPath), "<a%20b> <p> <o> .\n");
  EXPECT_FALSE(outcome.postCheck.has_value());
  EXPECT_EQ(unavailable.calls.size(), 1u);
  EXPECT_TRUE(captured_.contains(log::Level::Warning, "Validity unknown"));
}

TEST_F(FilePipelineTest, DanglingTailIsDroppedAndFlagged) {
  fs::path input = root() / "tail.nt";
  writeFile(input, "<a> <b> <c> .\n<d e> <f>\n<g>");

  ProcessingOutcome outcome = pipeline_.processFile(input, root());

  EXPECT_TRUE(outcome.danglingTail);
  EXPECT_EQ(outcome.kind, OutcomeKind::CleanedNoEdits);
  // No rewrite for the unflushed "<d e>"
  EXPECT_TRUE(outcome.record.iriRewrites.empty());
  EXPECT_EQ(readFile(outcome.outputPath), "<a> <b> <c> .\n");
  EXPECT_TRUE(captured_.contains(log::Level::Error,
                                 "Unbalanced multiline structure"));
}

TEST_F(FilePipelineTest, PostCheckDoesNotChangeOutcome) {
  fs::path input = root() / "recheck.nt";
  writeFile(input, "<a b> <p> <o> .\n");
  // Output still judged invalid: logged, nothing retried
  ProcessingOutcome outcome = pipeline_.processFile(input, root());

  ASSERT_TRUE(outcome.postCheck.has_value());
  EXPECT_EQ(*outcome.postCheck, OracleStatus::Invalid);
  EXPECT_EQ(outcome.kind, OutcomeKind::CleanedWithEdits);
  EXPECT_EQ(oracle_.calls.size(), 2u);
}

TEST_F(FilePipelineTest, NoTemporaryFilesLeftBehind) {
  fs::path input = root() / "tmpcheck.nt";
  writeFile(input, "<a b> <p> <o> .\n");

  ProcessingOutcome outcome = pipeline_.processFile(input, root());

  EXPECT_TRUE(fs::exists(outcome.outputPath));
  EXPECT_FALSE(fs::exists(outcome.outputPath.string() + ".tmp"));
  EXPECT_FALSE(fs::exists(outcome.changelogPath.string() + ".tmp"));
}

TEST_F(FilePipelineTest, MissingInputRaisesIoError) {
  EXPECT_THROW(pipeline_.processFile(root() / "absent.nt", root()),
               io::IoError);
  EXPECT_FALSE(fs::exists(root() / "rdf_cleaned" / "absent.nt"));
}

TEST_F(FilePipelineTest, CleanStreamMergeExample) {
  std::istringstream in(":a :b :c\n    .\n");
  std::ostringstream out;

  CleanResult result = pipeline_.cleanStream(in, out);

  EXPECT_EQ(out.str(), ":a :b :c     .\n");
  ASSERT_EQ(result.record.mergedStatements.size(), 1u);
  EXPECT_EQ(result.record.mergedStatements[0].line, 2);
  EXPECT_EQ(result.record.mergedStatements[0].mergedTriple, ":a :b :c     .");
  EXPECT_EQ(result.linesRead, 2);
  EXPECT_EQ(result.statementsWritten, 1);
}

TEST_F(FilePipelineTest, ProgressIsLoggedByDecile) {
  std::string content;
  for (int i = 0; i < 20; ++i) {
    content += "<s" + std::to_string(i) + "> <p> <o> .\n";
  }
  std::istringstream in(content);
  std::ostringstream out;

  pipeline_.cleanStream(in, out, 20);

  EXPECT_TRUE(captured_.contains(log::Level::Info, "2/20 lines processed (10%)"));
  EXPECT_TRUE(
      captured_.contains(log::Level::Info, "20/20 lines processed (100%)"));
}

TEST_F(FilePipelineTest, CustomOutputDirAndSuffix) {
  CleaningConfig config;
  config.outputDirName = "fixed";
  config.changelogSuffix = ".edits.json";
  FilePipeline pipeline(config, false, oracle_, logger_);

  fs::path input = root() / "a.ttl";
  writeFile(input, "<x> <y> <z> .\n");
  ProcessingOutcome outcome = pipeline.processFile(input, root());

  EXPECT_EQ(outcome.outputPath, root() / "fixed" / "a.ttl");
  EXPECT_EQ(outcome.changelogPath, root() / "fixed" / "a.ttl.edits.json");
  EXPECT_TRUE(fs::exists(outcome.changelogPath));
}

TEST(AtomicFileTest, CommitMovesTempOntoTarget) {
  TempDir dir("atomic");
  io::AtomicFile file(dir.path() / "out.nt");
  EXPECT_EQ(file.target(), dir.path() / "out.nt");
  EXPECT_EQ(file.tempPath(), dir.path() / "out.nt.tmp");

  file.stream() << "<a> <b> <c> .\n";
  EXPECT_TRUE(fs::exists(file.tempPath()));
  EXPECT_FALSE(fs::exists(file.target()));

  file.commit();
  EXPECT_FALSE(fs::exists(file.tempPath()));
  EXPECT_EQ(readFile(file.target()), "<a> <b> <c> .\n");
}

TEST(AtomicFileTest, UncommittedFileLeavesNothing) {
  TempDir dir("atomic_abort");
  writeFile(dir.path() / "out.nt.tmp", "stale");
  fs::path temp;
  {
    io::AtomicFile file(dir.path() / "out.nt");
    temp = file.tempPath();
    EXPECT_EQ(readFile(temp), "");
    file.stream() << "partial";
  }
  EXPECT_FALSE(fs::exists(temp));
  EXPECT_FALSE(fs::exists(dir.path() / "out.nt"));
}

} // namespace
} // namespace pipeline
} // namespace RdfClean
