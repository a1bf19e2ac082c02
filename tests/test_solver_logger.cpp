#include <gtest/gtest.h>
#include "solver_logger.hpp"
#include <iostream>
#include <sstream>

using namespace capsolve;

namespace {

// Captures std::cerr for the lifetime of the object.
class StderrCapture {
public:
    StderrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~StderrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::stringstream buffer_;
    std::streambuf* old_;
};

}

TEST(SolverLoggerTest, Fingerprint) {
    std::string fp = SolverLogger::fingerprint("a1b2c3d4e5f60718");
    EXPECT_EQ(fp.rfind("tok_", 0), 0u);
    EXPECT_EQ(fp.size(), 4u + 12u);
    EXPECT_EQ(fp, SolverLogger::fingerprint("a1b2c3d4e5f60718"));
    EXPECT_NE(fp, SolverLogger::fingerprint("a1b2c3d4e5f60719"));
    EXPECT_EQ(SolverLogger::fingerprint(""), "none");
}

TEST(SolverLoggerTest, Sanitization) {
    EXPECT_EQ(SolverLogger::sanitize_log_message("Malicious \" quote and \n newline"),
              "Malicious   quote and   newline");
    EXPECT_EQ(SolverLogger::sanitize_log_message(std::string("a\x01" "b", 3)), "ab");
}

TEST(SolverLoggerTest, NeverWritesRawToken) {
    SolverLogger::set_min_level(SolverLogger::Level::DEBUG);
    std::string line;
    {
        StderrCapture capture;
        SolverLogger::log(SolverLogger::Level::INFO, SolverLogger::EventType::BATCH_STARTED,
                          "secret-token-value", "challenges=3");
        line = capture.str();
    }
    SolverLogger::set_min_level(SolverLogger::Level::INFO);

    EXPECT_EQ(line.find("secret-token-value"), std::string::npos);
    EXPECT_NE(line.find("[INFO] [BATCH_START] tok=tok_"), std::string::npos);
    EXPECT_NE(line.find("msg=\"challenges=3\""), std::string::npos);
}

TEST(SolverLoggerTest, MinimumLevelFilters) {
    SolverLogger::set_min_level(SolverLogger::Level::WARNING);
    std::string out;
    {
        StderrCapture capture;
        SolverLogger::log(SolverLogger::Level::INFO, SolverLogger::EventType::CONFIG, "t", "dropped");
        out = capture.str();
    }
    SolverLogger::set_min_level(SolverLogger::Level::INFO);
    EXPECT_TRUE(out.empty());
}
