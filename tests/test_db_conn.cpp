#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "DBConn.hpp"
#include "Context.hpp"
#include "FaultInjector.hpp"
#include "mocks/FakeDatabase.hpp"
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <algorithm>
#include <chrono>
#include <thread>

using namespace sqlreplay;
using namespace sqlreplay::test;
using namespace std::chrono_literals;
using ::testing::_;

class DBConnTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeDBState>();

        // Keep retries fast
        options_.queryPolicy = RetryPolicy{5, 1ms, BackoffStrategy::Stable};
        options_.executePolicy = RetryPolicy{5, 1ms, BackoffStrategy::LinearIncrease};
    }

    std::unique_ptr<DBConn> makeConn(FaultInjector* injector = nullptr) {
        state_->openConns++;
        return std::make_unique<DBConn>("task-1", "source-1",
                                        std::make_unique<FakeBaseConn>(state_),
                                        recovery_, metrics_, injector, options_);
    }

    // Recovery that always hands out a fresh fake connection
    void recoverWithFreshConn() {
        ON_CALL(recovery_, recover(_, _))
            .WillByDefault([this](Context&, BaseConn&) -> std::unique_ptr<BaseConn> {
                state_->openConns++;
                return std::make_unique<FakeBaseConn>(state_);
            });
    }

    std::shared_ptr<FakeDBState> state_;
    ::testing::StrictMock<MockConnectionRecovery> recovery_;
    RecordingMetricsSink metrics_;
    DBConnOptions options_;
    Context ctx_;
};

// Preconditions
TEST_F(DBConnTest, QueryWithoutConnectionThrowsInvalidConnection) {
    DBConn conn("task-1", "source-1", nullptr, recovery_, metrics_, nullptr, options_);

    try {
        conn.query(ctx_, "SELECT 1");
        FAIL() << "expected InvalidConnectionError";
    } catch (const InvalidConnectionError& e) {
        EXPECT_EQ(e.scope(), ErrorScope::Downstream);
    }
    EXPECT_FALSE(conn.isValid());
    EXPECT_TRUE(metrics_.durations.empty());
}

TEST_F(DBConnTest, ExecuteWithoutConnectionThrowsInvalidConnection) {
    DBConn conn("task-1", "source-1", nullptr, recovery_, metrics_, nullptr, options_);

    EXPECT_THROW(conn.execute(ctx_, {"INSERT INTO t VALUES (1)"}), InvalidConnectionError);
    EXPECT_EQ(metrics_.errors, 0);
}

TEST_F(DBConnTest, EmptyExecuteHasNoSideEffects) {
    auto conn = makeConn();

    conn->execute(ctx_, {});

    EXPECT_EQ(state_->executeCalls, 0);
    EXPECT_EQ(metrics_.errors, 0);
    EXPECT_TRUE(metrics_.durations.empty());
}

TEST_F(DBConnTest, EmptyExecuteOnInvalidConnectionIsNoop) {
    DBConn conn("task-1", "source-1", nullptr, recovery_, metrics_, nullptr, options_);

    EXPECT_NO_THROW(conn.execute(ctx_, {}));
}

TEST_F(DBConnTest, ArgumentCountMismatchIsRejected) {
    auto conn = makeConn();

    EXPECT_THROW(conn->execute(ctx_, {"INSERT INTO t VALUES (?)", "INSERT INTO t VALUES (?)"},
                               {Args{int64_t{1}}}),
                 std::invalid_argument);
    EXPECT_EQ(state_->executeCalls, 0);
}

TEST_F(DBConnTest, MatchingArgumentCountIsAccepted) {
    auto conn = makeConn();

    conn->execute(ctx_, {"INSERT INTO t VALUES (?)", "INSERT INTO t VALUES (?)"},
                  {Args{int64_t{1}}, Args{int64_t{2}}});

    EXPECT_EQ(state_->executeCalls, 1);
}

// Success path
TEST_F(DBConnTest, QueryReturnsRowsAndRecordsDuration) {
    state_->rows.columns = {"id", "name"};
    state_->rows.rows = {{std::string("1"), std::string("alice")},
                         {std::string("2"), std::nullopt}};
    auto conn = makeConn();

    Rows rows = conn->query(ctx_, "SELECT id, name FROM users");

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows.columns[1], "name");
    EXPECT_FALSE(rows.rows[1][1].has_value());
    ASSERT_EQ(metrics_.durations.size(), 1u);
    EXPECT_GE(metrics_.durations[0], 0.0);
    EXPECT_EQ(metrics_.durationLabels[0].name, "task-1");
    EXPECT_EQ(metrics_.durationLabels[0].sourceId, "source-1");
}

TEST_F(DBConnTest, ExecuteRunsWholeBatchOnce) {
    auto conn = makeConn();

    conn->execute(ctx_, {"INSERT INTO t VALUES (1)", "INSERT INTO t VALUES (2)"});

    ASSERT_EQ(state_->executed.size(), 1u);
    EXPECT_EQ(state_->executed[0].size(), 2u);
    EXPECT_EQ(metrics_.errors, 0);
}

// Connection loss and recovery
TEST_F(DBConnTest, ConnectionLostRecoversThenSucceeds) {
    state_->outcomes = {Outcome::fail(CR_SERVER_LOST),
                        Outcome::fail(CR_SERVER_GONE_ERROR),
                        Outcome::fail(CR_SERVER_LOST),
                        Outcome::ok()};
    recoverWithFreshConn();
    EXPECT_CALL(recovery_, recover(_, _)).Times(3);
    auto conn = makeConn();

    conn->query(ctx_, "SELECT 1");

    EXPECT_EQ(state_->queryCalls, 4);
    EXPECT_TRUE(conn->isValid());
}

TEST_F(DBConnTest, ConnectionLostMessageTriggersRecovery) {
    state_->outcomes = {Outcome::fail(CR_UNKNOWN_ERROR, "write: connection reset by peer"),
                        Outcome::ok()};
    recoverWithFreshConn();
    EXPECT_CALL(recovery_, recover(_, _)).Times(1);
    auto conn = makeConn();

    conn->execute(ctx_, {"INSERT INTO t VALUES (1)"});

    EXPECT_EQ(state_->executeCalls, 2);
    EXPECT_EQ(metrics_.errors, 1);
}

TEST_F(DBConnTest, RecoveryFailureStopsImmediately) {
    state_->fallback = Outcome::fail(CR_SERVER_GONE_ERROR);
    EXPECT_CALL(recovery_, recover(_, _))
        .WillOnce([](Context&, BaseConn&) -> std::unique_ptr<BaseConn> {
            throw ResetConnectionError("cannot reconnect", CR_CONN_HOST_ERROR);
        });
    auto conn = makeConn();

    try {
        conn->query(ctx_, "SELECT 1");
        FAIL() << "expected ResetConnectionError";
    } catch (const ResetConnectionError& e) {
        EXPECT_EQ(e.causeCode(), static_cast<unsigned int>(CR_CONN_HOST_ERROR));
        EXPECT_EQ(e.scope(), ErrorScope::Downstream);
    }
    EXPECT_EQ(state_->queryCalls, 1);
    // The old connection stays in place
    EXPECT_TRUE(conn->isValid());
}

TEST_F(DBConnTest, RecoveryReturningNothingIsResetError) {
    state_->fallback = Outcome::fail(CR_SERVER_LOST);
    EXPECT_CALL(recovery_, recover(_, _))
        .WillOnce([](Context&, BaseConn&) -> std::unique_ptr<BaseConn> { return nullptr; });
    auto conn = makeConn();

    EXPECT_THROW(conn->execute(ctx_, {"INSERT INTO t VALUES (1)"}), ResetConnectionError);
    EXPECT_EQ(state_->executeCalls, 1);
}

TEST_F(DBConnTest, NoRecoveryOnLastAttempt) {
    options_.queryPolicy.maxAttempts = 2;
    state_->fallback = Outcome::fail(CR_SERVER_LOST);
    recoverWithFreshConn();
    EXPECT_CALL(recovery_, recover(_, _)).Times(1);
    auto conn = makeConn();

    try {
        conn->query(ctx_, "SELECT 1");
        FAIL() << "expected MySQLException";
    } catch (const MySQLException& e) {
        EXPECT_EQ(e.errorCode(), static_cast<unsigned int>(CR_SERVER_LOST));
        EXPECT_EQ(e.scope(), ErrorScope::Downstream);
    }
    EXPECT_EQ(state_->queryCalls, 2);
}

// Retryable, fatal and idempotent errors
TEST_F(DBConnTest, RetryableErrorExhaustsBudget) {
    state_->fallback = Outcome::fail(ER_LOCK_DEADLOCK, "Deadlock found");
    auto conn = makeConn();

    try {
        conn->execute(ctx_, {"UPDATE t SET a = 1"});
        FAIL() << "expected MySQLException";
    } catch (const MySQLException& e) {
        EXPECT_EQ(e.errorCode(), static_cast<unsigned int>(ER_LOCK_DEADLOCK));
        EXPECT_EQ(e.scope(), ErrorScope::Downstream);
    }
    EXPECT_EQ(state_->executeCalls, options_.executePolicy.maxAttempts);
    EXPECT_EQ(metrics_.errors, options_.executePolicy.maxAttempts);
}

TEST_F(DBConnTest, RetryableQueryErrorThenSuccess) {
    state_->outcomes = {Outcome::fail(ErrorHandler::ER_TIDB_TIKV_SERVER_BUSY),
                        Outcome::fail(ER_LOCK_WAIT_TIMEOUT),
                        Outcome::ok()};
    auto conn = makeConn();

    conn->query(ctx_, "SELECT 1");

    EXPECT_EQ(state_->queryCalls, 3);
    EXPECT_EQ(metrics_.durations.size(), 1u);
}

TEST_F(DBConnTest, FatalErrorStopsAfterOneAttempt) {
    state_->fallback = Outcome::fail(ER_PARSE_ERROR, "You have an error in your SQL syntax");
    auto conn = makeConn();

    try {
        conn->execute(ctx_, {"INSERT INTO"});
        FAIL() << "expected MySQLException";
    } catch (const IdempotentOutcomeError&) {
        FAIL() << "parse error is not idempotent";
    } catch (const MySQLException& e) {
        EXPECT_EQ(e.errorCode(), static_cast<unsigned int>(ER_PARSE_ERROR));
    }
    EXPECT_EQ(state_->executeCalls, 1);
    EXPECT_EQ(metrics_.errors, 1);
}

TEST_F(DBConnTest, TableExistsIsIdempotentOutcome) {
    state_->fallback = Outcome::fail(ER_TABLE_EXISTS_ERROR, "Table 't' already exists");
    auto conn = makeConn();

    try {
        conn->execute(ctx_, {"CREATE TABLE t (id INT)"});
        FAIL() << "expected IdempotentOutcomeError";
    } catch (const IdempotentOutcomeError& e) {
        EXPECT_TRUE(ErrorHandler::isErrTableExists(e));
        EXPECT_EQ(e.scope(), ErrorScope::Downstream);
    }
    EXPECT_EQ(state_->executeCalls, 1);
}

TEST_F(DBConnTest, DuplicateEntryIsIdempotentOutcome) {
    state_->fallback = Outcome::fail(ER_DUP_ENTRY, "Duplicate entry '1' for key 'PRIMARY'");
    auto conn = makeConn();

    EXPECT_THROW(conn->execute(ctx_, {"INSERT INTO t VALUES (1)"}), IdempotentOutcomeError);
    EXPECT_EQ(state_->executeCalls, 1);
}

TEST_F(DBConnTest, ServerErrorQuotingTransportWordsIsNotConnectionLoss) {
    // StrictMock recovery: any reset attempt fails the test
    state_->fallback = Outcome::fail(ER_DUP_ENTRY, "Duplicate entry 'broken pipe' for key 'PRIMARY'");
    auto conn = makeConn();

    EXPECT_THROW(conn->execute(ctx_, {"INSERT INTO t VALUES ('broken pipe')"}),
                 IdempotentOutcomeError);
    EXPECT_EQ(state_->executeCalls, 1);
}

TEST_F(DBConnTest, ParseErrorQuotingTransportWordsIsFatal) {
    state_->fallback = Outcome::fail(ER_PARSE_ERROR,
                                     "You have an error in your SQL syntax near 'bad connection'");
    auto conn = makeConn();

    EXPECT_THROW(conn->query(ctx_, "SELEC 'bad connection'"), MySQLException);
    EXPECT_EQ(state_->queryCalls, 1);
}

// Cancellation
TEST_F(DBConnTest, CancelledContextMakesNoCalls) {
    auto conn = makeConn();
    ctx_.cancel();

    try {
        conn->query(ctx_, "SELECT 1");
        FAIL() << "expected CancelledError";
    } catch (const CancelledError& e) {
        EXPECT_EQ(e.reason(), CancelReason::Canceled);
        EXPECT_EQ(e.scope(), ErrorScope::Downstream);
    }
    EXPECT_EQ(state_->queryCalls, 0);
}

TEST_F(DBConnTest, CancelDuringBackoffReturnsPromptly) {
    options_.executePolicy = RetryPolicy{10, 10s, BackoffStrategy::LinearIncrease};
    state_->fallback = Outcome::fail(ER_LOCK_WAIT_TIMEOUT);
    auto conn = makeConn();

    std::thread canceller([this] {
        std::this_thread::sleep_for(50ms);
        ctx_.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(conn->execute(ctx_, {"UPDATE t SET a = 1"}), CancelledError);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(state_->executeCalls, 1);
}

TEST_F(DBConnTest, DeadlineDuringBackoff) {
    options_.queryPolicy = RetryPolicy{10, 10s, BackoffStrategy::Stable};
    state_->fallback = Outcome::fail(ER_LOCK_DEADLOCK);
    auto conn = makeConn();
    auto ctx = Context::withTimeout(50ms);

    try {
        conn->query(*ctx, "SELECT 1");
        FAIL() << "expected CancelledError";
    } catch (const CancelledError& e) {
        EXPECT_EQ(e.reason(), CancelReason::DeadlineExceeded);
    }
    EXPECT_EQ(state_->queryCalls, 1);
}

TEST_F(DBConnTest, CancellationNeverTriggersRecovery) {
    // The context is cancelled while the call is in flight, which then reports a lost connection
    state_->fallback = Outcome::fail(CR_SERVER_LOST);
    state_->onCall = [this] { ctx_.cancel(); };
    auto conn = makeConn();
    EXPECT_CALL(recovery_, recover(_, _)).Times(0);

    EXPECT_THROW(conn->query(ctx_, "SELECT 1"), CancelledError);
}

// Fault injection
TEST_F(DBConnTest, InjectedFatalErrorIsSurfaced) {
    FaultInjector injector;
    injector.arm(kExecCreateTableFailed, ER_PARSE_ERROR);
    auto conn = makeConn(&injector);

    try {
        conn->execute(ctx_, {"CREATE TABLE t (id INT)"});
        FAIL() << "expected MySQLException";
    } catch (const MySQLException& e) {
        EXPECT_EQ(e.errorCode(), static_cast<unsigned int>(ER_PARSE_ERROR));
    }
    // The real execution ran before the injected failure
    EXPECT_EQ(state_->executeCalls, 1);
    EXPECT_EQ(injector.hits(kExecCreateTableFailed), 1u);
    EXPECT_FALSE(injector.isArmed(kExecCreateTableFailed));
}

TEST_F(DBConnTest, InjectedRetryableErrorIsRetried) {
    FaultInjector injector;
    injector.arm(kExecCreateTableFailed, ER_LOCK_DEADLOCK);
    auto conn = makeConn(&injector);

    conn->execute(ctx_, {"CREATE TABLE t (id INT)"});

    EXPECT_EQ(state_->executeCalls, 2);
    EXPECT_EQ(metrics_.errors, 1);
}

TEST_F(DBConnTest, InjectedConnectionLossTriggersRecovery) {
    FaultInjector injector;
    injector.arm(kExecCreateTableFailed, CR_SERVER_LOST);
    recoverWithFreshConn();
    EXPECT_CALL(recovery_, recover(_, _)).Times(1);
    auto conn = makeConn(&injector);

    conn->execute(ctx_, {"CREATE TABLE t (id INT)"});

    EXPECT_EQ(state_->executeCalls, 2);
}

TEST_F(DBConnTest, InjectionSkipsOtherStatements) {
    FaultInjector injector;
    injector.arm(kExecCreateTableFailed, ER_PARSE_ERROR);
    auto conn = makeConn(&injector);

    conn->execute(ctx_, {"INSERT INTO t VALUES (1)"});
    conn->execute(ctx_, {"CREATE TABLE t (id INT)", "INSERT INTO t VALUES (1)"});

    EXPECT_TRUE(injector.isArmed(kExecCreateTableFailed));
    EXPECT_EQ(injector.hits(kExecCreateTableFailed), 0u);
}

TEST_F(DBConnTest, ScopeIsDownstreamWithConnection) {
    auto conn = makeConn();
    DBConn empty("task-1", "source-1", nullptr, recovery_, metrics_, nullptr, options_);

    EXPECT_EQ(conn->scope(), ErrorScope::Downstream);
    EXPECT_EQ(empty.scope(), ErrorScope::NotSet);
    EXPECT_EQ(conn->name(), "task-1");
    EXPECT_EQ(conn->sourceId(), "source-1");
}

// Backoff between attempts
class DBConnBackoffTest : public DBConnTest {
protected:
    void SetUp() override {
        DBConnTest::SetUp();
        state_->fallback = Outcome::fail(ER_LOCK_WAIT_TIMEOUT);
        state_->onCall = [this] { calls_.push_back(std::chrono::steady_clock::now()); };
    }

    std::vector<std::chrono::milliseconds> gaps() const {
        std::vector<std::chrono::milliseconds> out;
        for (size_t i = 1; i < calls_.size(); ++i) {
            out.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(calls_[i] - calls_[i - 1]));
        }
        return out;
    }

    std::vector<std::chrono::steady_clock::time_point> calls_;
};

TEST_F(DBConnBackoffTest, ExecuteWaitsGrowLinearly) {
    options_.executePolicy = RetryPolicy{4, 20ms, BackoffStrategy::LinearIncrease};
    auto conn = makeConn();

    EXPECT_THROW(conn->execute(ctx_, {"UPDATE t SET a = 1"}), MySQLException);

    auto waits = gaps();
    ASSERT_EQ(waits.size(), 3u);
    EXPECT_GE(waits[0], 20ms);
    EXPECT_GE(waits[1], 40ms);
    EXPECT_GE(waits[2], 60ms);
}

TEST_F(DBConnBackoffTest, QueryWaitsStayConstant) {
    options_.queryPolicy = RetryPolicy{4, 50ms, BackoffStrategy::Stable};
    auto conn = makeConn();

    EXPECT_THROW(conn->query(ctx_, "SELECT 1"), MySQLException);

    auto waits = gaps();
    ASSERT_EQ(waits.size(), 3u);
    for (auto wait : waits) {
        EXPECT_GE(wait, 50ms);
    }
    // A growing schedule would wait at least 150ms before the last attempt
    EXPECT_LT(waits[2], 140ms);
}

// Slow operation warning
class DBConnLogTest : public DBConnTest {
protected:
    void SetUp() override {
        DBConnTest::SetUp();
        previous_ = spdlog::default_logger();
        sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
        sink_->set_pattern("[%l] %v");
        auto logger = std::make_shared<spdlog::logger>("db_conn_test", sink_);
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);
    }

    void TearDown() override {
        spdlog::set_default_logger(previous_);
    }

    bool logged(const std::string& text) const {
        auto lines = sink_->last_formatted();
        return std::any_of(lines.begin(), lines.end(), [&text](const std::string& line) {
            return line.find(text) != std::string::npos;
        });
    }

    std::shared_ptr<spdlog::logger> previous_;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

TEST_F(DBConnLogTest, SlowQueryIsLogged) {
    options_.slowThreshold = 0ms;
    state_->onCall = [] { std::this_thread::sleep_for(2ms); };
    auto conn = makeConn();

    conn->query(ctx_, "SELECT SLEEP(1)");

    EXPECT_TRUE(logged("[warning] [task-1/source-1] query statement too slow"));
    EXPECT_TRUE(logged("SELECT SLEEP(1)"));
}

TEST_F(DBConnLogTest, SlowExecuteIsLogged) {
    options_.slowThreshold = 0ms;
    state_->onCall = [] { std::this_thread::sleep_for(2ms); };
    auto conn = makeConn();

    conn->execute(ctx_, {"INSERT INTO t VALUES (1)"});

    EXPECT_TRUE(logged("execute statements too slow"));
}

TEST_F(DBConnLogTest, FastOperationIsNotLogged) {
    auto conn = makeConn();

    conn->query(ctx_, "SELECT 1");

    EXPECT_FALSE(logged("too slow"));
}
