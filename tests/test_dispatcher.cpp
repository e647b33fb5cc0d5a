#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <set>
#include <thread>
#include <unistd.h>

#include "app/dispatcher.hpp"
#include "crypto/block_cipher.hpp"
#include "proto/wire.hpp"
#include "transport/loopback_transport.hpp"

using namespace app;
using namespace std::chrono_literals;
using transport::Frame;
using transport::LoopbackConnection;
using transport::LoopbackServer;
namespace fs = std::filesystem;

namespace
{

using Conn = std::shared_ptr<LoopbackConnection>;

std::uint16_t ack_id(const Frame &f)
{
    return static_cast<std::uint16_t>((f[0] << 8) | f[1]);
}

wire::ServerHeader server_hdr(const Frame &f)
{
    auto h = wire::parse_server_header(f);
    return h ? *h : wire::ServerHeader{0xFFFF, 0xFFFF};
}

std::string status_type(const Frame &f)
{
    auto body = wire::decode_body(wire::CMD_STATUS, f);
    auto s    = body ? wire::as_status(*body) : std::nullopt;
    return s ? s->type : std::string("<none>");
}

// negated copy, like the reference worker would send
std::vector<std::uint8_t> work(const Frame &task_frame)
{
    std::vector<std::uint8_t> out(task_frame.begin() + wire::HDR_SIZE, task_frame.end());
    for (auto &b : out)
        b = static_cast<std::uint8_t>(~b);
    return out;
}

class FailingCipher : public cipher::BlockCipher
{
  public:
    bool encrypt(const std::vector<std::uint8_t> &, const cipher::Key &, const cipher::Iv &,
                 std::vector<std::uint8_t> &) override
    {
        return false;
    }
    bool decrypt(const std::vector<std::uint8_t> &, const cipher::Key &, const cipher::Iv &,
                 std::vector<std::uint8_t> &) override
    {
        return false;
    }
    const char *name() const override { return "failing"; }
};

}  // namespace

class DispatcherTest : public ::testing::Test
{
  protected:
    fs::path                    dir;
    cipher::AesCbcCipher        aes;
    std::unique_ptr<Finalizer>  fin;
    std::unique_ptr<Dispatcher> disp;
    LoopbackServer              srv;
    std::map<std::uint64_t, std::uint16_t> ids;  // conn id -> peer id

    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              (std::string("chunkfarm-disp-") + info->name() + "-" + std::to_string(::getpid()));
        fs::remove_all(dir);
        make(aes);
    }

    void TearDown() override
    {
        srv.stop();
        disp.reset();
        fs::remove_all(dir);
    }

    void make(cipher::BlockCipher &engine)
    {
        srv.stop();
        disp.reset();
        fin  = std::make_unique<Finalizer>(ArtifactPaths{(dir / "result.raw").string(),
                                                         (dir / "key.bin").string(),
                                                         (dir / "iv.bin").string()},
                                           engine);
        disp = std::make_unique<Dispatcher>(*fin);

        // drive the dispatcher synchronously: each callback is handled before it returns
        transport::Callbacks cb;
        cb.on_connect = [this](const transport::ConnPtr &c) { disp->handle(PeerConnected{c}); };
        cb.on_message = [this](const transport::ConnPtr &c, Frame f) {
            disp->handle(FrameReceived{c, std::move(f)});
        };
        cb.on_close = [this](const transport::ConnPtr &c) { disp->handle(PeerDisconnected{c}); };
        srv.start({}, cb);
    }

    // n tasks of `size` bytes each
    void load(std::size_t n, std::size_t size = 8)
    {
        std::vector<job::Chunk> chunks;
        for (std::size_t i = 0; i < n; i++)
        {
            job::Chunk c;
            c.seq = i;
            c.bytes.assign(size, static_cast<std::uint8_t>(i + 1));
            chunks.push_back(std::move(c));
        }
        disp->handle(TasksLoaded{std::move(chunks)});
    }

    Conn join(const std::string &nick = "w")
    {
        Conn c = srv.connect();
        srv.deliver(c, wire::encode_handshake(nick));
        EXPECT_EQ(c->sent_count(), 1u);
        Frame ack = c->last_sent();
        EXPECT_EQ(ack.size(), wire::ACK_SIZE);
        if (ack.size() == wire::ACK_SIZE)
            ids[c->id()] = ack_id(ack);
        c->clear();
        return c;
    }

    std::uint16_t pid(const Conn &c) { return ids[c->id()]; }

    Frame request(const Conn &c)
    {
        const std::size_t before = c->sent_count();
        srv.deliver(c, wire::encode_request_task(pid(c)));
        EXPECT_EQ(c->sent_count(), before + 1);
        return c->last_sent();
    }

    void submit(const Conn &c, std::uint32_t task, const std::vector<std::uint8_t> &bytes)
    {
        srv.deliver(c, wire::encode_submit_result(pid(c), task, bytes));
    }
};

TEST_F(DispatcherTest, HandshakeAssignsIncreasingIds)
{
    Conn a = join("alice");
    Conn b = join("bob");
    EXPECT_EQ(pid(a), 1);
    EXPECT_EQ(pid(b), 2);
    EXPECT_EQ(disp->registry().size(), 2u);
    ASSERT_NE(disp->registry().nickname(2), nullptr);
    EXPECT_EQ(*disp->registry().nickname(2), "bob");
}

TEST_F(DispatcherTest, HandshakeIgnoresHeaderPeerId)
{
    Conn  c = srv.connect();
    Frame f = wire::encode_handshake("x");
    f[0]    = 0x12;  // bogus peer id in the header
    f[1]    = 0x34;
    srv.deliver(c, f);
    ASSERT_EQ(c->sent_count(), 1u);
    EXPECT_EQ(ack_id(c->last_sent()), 1);
}

TEST_F(DispatcherTest, RepeatedHandshakeKeepsId)
{
    Conn a = join();
    srv.deliver(a, wire::encode_handshake("again"));
    ASSERT_EQ(a->sent_count(), 1u);
    EXPECT_EQ(ack_id(a->last_sent()), pid(a));
    EXPECT_EQ(disp->registry().size(), 1u);
}

TEST_F(DispatcherTest, RequestBeforeLoadGetsNoTask)
{
    Conn  a = join();
    Frame r = request(a);
    EXPECT_EQ(server_hdr(r).command, wire::CMD_STATUS);
    EXPECT_EQ(status_type(r), "no-task");
    EXPECT_FALSE(disp->ready());
}

TEST_F(DispatcherTest, RequestHandsOutTasksInOrder)
{
    load(3);
    EXPECT_TRUE(disp->ready());
    Conn a = join();
    Conn b = join();

    Frame r1 = request(a);
    Frame r2 = request(b);
    Frame r3 = request(a);
    EXPECT_EQ(server_hdr(r1).command, wire::CMD_TASK_DATA);
    EXPECT_EQ(server_hdr(r1).value, 1);
    EXPECT_EQ(server_hdr(r2).value, 2);
    EXPECT_EQ(server_hdr(r3).value, 3);
    EXPECT_EQ(Frame(r1.begin() + 4, r1.end()), std::vector<std::uint8_t>(8, 1));

    EXPECT_EQ(*disp->registry().loans(pid(a)), (std::set<TaskId>{1, 3}));
    EXPECT_EQ(*disp->registry().loans(pid(b)), (std::set<TaskId>{2}));

    Frame none = request(b);
    EXPECT_EQ(status_type(none), "no-task");
}

TEST_F(DispatcherTest, UnregisteredPeerDroppedSilently)
{
    load(2);
    Conn stranger = srv.connect();
    srv.deliver(stranger, wire::encode_request_task(99));
    srv.deliver(stranger, wire::encode_submit_result(99, 1, std::vector<std::uint8_t>(8)));
    EXPECT_EQ(stranger->sent_count(), 0u);
    EXPECT_EQ(disp->store().find(1)->status, tasks::Status::Pending);
}

TEST_F(DispatcherTest, ForeignPeerIdDropped)
{
    load(2);
    Conn a = join();
    Conn b = join();
    // b claims to be a
    srv.deliver(b, wire::encode_request_task(pid(a)));
    EXPECT_EQ(a->sent_count(), 0u);
    EXPECT_EQ(b->sent_count(), 0u);
    EXPECT_EQ(disp->store().counts().assigned, 0u);
}

TEST_F(DispatcherTest, ShortAndUnknownFramesDropped)
{
    load(1);
    Conn a = join();
    srv.deliver(a, Frame{0x00, 0x01});
    Frame unknown(4);
    wire::pack_header(wire::Header{pid(a), 7}, unknown.data());
    srv.deliver(a, unknown);
    EXPECT_EQ(a->sent_count(), 0u);
    EXPECT_TRUE(a->is_open());

    // the link still works
    EXPECT_EQ(server_hdr(request(a)).value, 1);
}

TEST_F(DispatcherTest, MalformedSubmissionDropped)
{
    load(1);
    Conn a = join();
    request(a);

    Frame bad = wire::encode_request_task(pid(a));
    bad[3]    = static_cast<std::uint8_t>(wire::CMD_SUBMIT_RESULT);  // body is {}
    srv.deliver(a, bad);

    Frame junk(4);
    wire::pack_header(wire::Header{pid(a), wire::CMD_SUBMIT_RESULT}, junk.data());
    const std::string text = R"({"taskId":1,"result":"not base64!"})";
    junk.insert(junk.end(), text.begin(), text.end());
    srv.deliver(a, junk);

    EXPECT_EQ(a->sent_count(), 1u);  // only the task-data
    EXPECT_EQ(disp->store().find(1)->status, tasks::Status::Assigned);
}

TEST_F(DispatcherTest, MalformedTaskRequestDropped)
{
    load(2);
    Conn a = join();

    Frame garbage(4);
    wire::pack_header(wire::Header{pid(a), wire::CMD_REQUEST_TASK}, garbage.data());
    const std::string text = "{garbage";
    garbage.insert(garbage.end(), text.begin(), text.end());
    srv.deliver(a, garbage);

    // valid JSON, but not an object
    Frame list(4);
    wire::pack_header(wire::Header{pid(a), wire::CMD_REQUEST_TASK}, list.data());
    const std::string arr = "[1,2]";
    list.insert(list.end(), arr.begin(), arr.end());
    srv.deliver(a, list);

    EXPECT_EQ(a->sent_count(), 0u);
    EXPECT_EQ(disp->store().counts().assigned, 0u);
    EXPECT_TRUE(disp->registry().loans(pid(a))->empty());
    EXPECT_TRUE(a->is_open());

    // a well-formed request still gets the first task
    EXPECT_EQ(server_hdr(request(a)).value, 1);
}

TEST_F(DispatcherTest, UnknownCommandWithBadBodyDropped)
{
    load(1);
    Conn  a = join();
    Frame f(4);
    wire::pack_header(wire::Header{pid(a), 9}, f.data());
    f.push_back('{');

    testing::internal::CaptureStderr();
    srv.deliver(a, f);
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(a->sent_count(), 0u);
    EXPECT_NE(err.find("malformed body"), std::string::npos);
}

TEST_F(DispatcherTest, WrongLengthResultLeavesTaskAssigned)
{
    load(2);
    Conn a = join();
    request(a);
    submit(a, 1, std::vector<std::uint8_t>(5));

    const auto *t = disp->store().find(1);
    EXPECT_EQ(t->status, tasks::Status::Assigned);
    EXPECT_EQ(t->assigned_peer, pid(a));
    EXPECT_EQ(disp->registry().loans(pid(a))->count(1), 1u);
}

TEST_F(DispatcherTest, DisconnectRequeuesAndRedispatches)
{
    load(3);
    Conn a = join("first");
    Conn b = join("second");

    Frame got = request(a);
    ASSERT_EQ(server_hdr(got).value, 1);
    EXPECT_EQ(b->sent_count(), 0u);

    srv.disconnect(a);

    // b got task #1 without asking
    ASSERT_EQ(b->sent_count(), 1u);
    EXPECT_EQ(server_hdr(b->last_sent()).command, wire::CMD_TASK_DATA);
    EXPECT_EQ(server_hdr(b->last_sent()).value, 1);

    const auto *t = disp->store().find(1);
    EXPECT_EQ(t->status, tasks::Status::Assigned);
    EXPECT_EQ(t->assigned_peer, pid(b));
    EXPECT_EQ(disp->registry().loans(pid(b))->count(1), 1u);
    EXPECT_FALSE(disp->registry().contains(pid(a)));
}

TEST_F(DispatcherTest, DisconnectWithoutOtherPeersLeavesPending)
{
    load(3);
    Conn a = join();
    request(a);
    request(a);
    srv.disconnect(a);

    auto c = disp->store().counts();
    EXPECT_EQ(c.pending, 3u);
    EXPECT_EQ(c.assigned, 0u);
    EXPECT_EQ(disp->registry().size(), 0u);
}

TEST_F(DispatcherTest, DisconnectAfterSubmitKeepsResult)
{
    load(2);
    Conn  a = join();
    Frame t = request(a);
    submit(a, 1, work(t));
    srv.disconnect(a);
    EXPECT_EQ(disp->store().find(1)->status, tasks::Status::Done);
}

TEST_F(DispatcherTest, ClosedPeerIsSkippedOnRedispatch)
{
    load(2);
    Conn a = join();
    Conn b = join();
    Conn c = join();
    request(a);
    b->close();  // closed but its disconnect not yet processed
    srv.disconnect(a);

    EXPECT_EQ(b->sent_count(), 0u);
    ASSERT_EQ(c->sent_count(), 1u);
    EXPECT_EQ(server_hdr(c->last_sent()).value, 1);
}

TEST_F(DispatcherTest, SweepReclaimsStuckTasks)
{
    load(2);
    Conn a = join();
    request(a);
    const auto now = tasks::Clock::now();

    disp->handle(SweepTick{now + 1000ms});
    EXPECT_EQ(disp->store().find(1)->status, tasks::Status::Assigned);

    disp->handle(SweepTick{now + 6000ms});
    EXPECT_EQ(disp->store().find(1)->status, tasks::Status::Pending);
    EXPECT_TRUE(disp->registry().loans(pid(a))->empty());

    // the next request gets it back
    EXPECT_EQ(server_hdr(request(a)).value, 1);
}

TEST_F(DispatcherTest, LateResultFromPreviousHolderReleasesBothLoans)
{
    load(1);
    Conn  a  = join();
    Conn  b  = join();
    Frame ta = request(a);
    disp->handle(SweepTick{tasks::Clock::now() + 10s});
    Frame tb = request(b);
    ASSERT_EQ(server_hdr(tb).value, 1);

    submit(a, 1, work(ta));  // a was slow but finished first
    EXPECT_EQ(disp->store().find(1)->status, tasks::Status::Done);
    EXPECT_TRUE(disp->registry().loans(pid(a))->empty());
    EXPECT_TRUE(disp->registry().loans(pid(b))->empty());
}

TEST_F(DispatcherTest, CompletionBroadcastAfterFinalize)
{
    load(3, 8);
    Conn                          a = join();
    Conn                          b = join();
    std::optional<FinalizeReport> seen;
    disp->set_on_finalized([&](const FinalizeReport &r) { seen = r; });

    Frame t1 = request(a);
    Frame t2 = request(b);
    Frame t3 = request(a);
    submit(a, 1, work(t1));
    submit(b, 2, work(t2));
    EXPECT_FALSE(disp->finalize_outcome().has_value());
    a->clear();
    b->clear();
    submit(a, 3, work(t3));

    ASSERT_EQ(a->sent_count(), 1u);
    ASSERT_EQ(b->sent_count(), 1u);
    EXPECT_EQ(status_type(a->last_sent()), "completion");
    EXPECT_EQ(status_type(b->last_sent()), "completion");

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->status, FinalizeStatus::Ok);
    EXPECT_EQ(disp->finalize_outcome(), FinalizeStatus::Ok);
    EXPECT_TRUE(fs::exists(dir / "result.raw"));
    EXPECT_TRUE(fs::exists(dir / "key.bin"));
    EXPECT_TRUE(fs::exists(dir / "iv.bin"));

    // replay after completion changes nothing and finalize does not run again
    seen.reset();
    submit(a, 3, work(t3));
    EXPECT_FALSE(seen.has_value());
    EXPECT_EQ(a->sent_count(), 1u);
}

TEST_F(DispatcherTest, FailedFinalizeSendsNoCompletion)
{
    FailingCipher failing;
    make(failing);
    load(1);
    Conn  a = join();
    Frame t = request(a);
    a->clear();
    submit(a, 1, work(t));

    EXPECT_EQ(a->sent_count(), 0u);
    EXPECT_EQ(disp->finalize_outcome(), FinalizeStatus::CryptoError);
    EXPECT_FALSE(fs::exists(dir / "result.raw"));
}

TEST_F(DispatcherTest, StatusLineReflectsState)
{
    load(3);
    Conn a = join();
    request(a);
    EXPECT_EQ(disp->status_line(), "tasks=3 pending=2 assigned=1 done=0 peers=1");
}

TEST(DispatcherQueue, EventsFromOtherThreadsAreSerialized)
{
    cipher::AesCbcCipher aes;
    const fs::path       dir = fs::temp_directory_path() /
                         ("chunkfarm-disp-queue-" + std::to_string(::getpid()));
    Finalizer fin({(dir / "r").string(), (dir / "k").string(), (dir / "i").string()}, aes);
    DispatcherSettings ds;
    ds.sweep_interval = 20ms;
    Dispatcher disp(fin, ds);
    ASSERT_TRUE(disp.start());

    LoopbackServer srv;
    srv.start({}, disp.callbacks());

    std::vector<job::Chunk> chunks(4);
    for (std::size_t i = 0; i < chunks.size(); i++)
    {
        chunks[i].seq = i;
        chunks[i].bytes.assign(4, 0);
    }
    disp.post(TasksLoaded{std::move(chunks)});

    // several threads handshaking and requesting at once
    std::vector<Conn>        conns;
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++)
        conns.push_back(srv.connect());
    for (auto &c : conns)
        threads.emplace_back([&srv, c] { srv.deliver(c, wire::encode_handshake("t")); });
    for (auto &t : threads)
        t.join();

    for (int i = 0; i < 200 && disp.status_line().find("peers=4") == std::string::npos; i++)
        std::this_thread::sleep_for(5ms);
    ASSERT_NE(disp.status_line().find("peers=4"), std::string::npos);
    EXPECT_TRUE(disp.ready());

    for (auto &c : conns)
        srv.deliver(c, wire::encode_request_task(ack_id(c->sent()[0])));
    for (int i = 0; i < 200 && disp.status_line().find("assigned=4") == std::string::npos; i++)
        std::this_thread::sleep_for(5ms);
    EXPECT_EQ(disp.status_line(), "tasks=4 pending=0 assigned=4 done=0 peers=4");

    std::set<std::uint16_t> handed;
    for (auto &c : conns)
    {
        ASSERT_EQ(c->sent_count(), 2u);
        handed.insert(server_hdr(c->last_sent()).value);
    }
    EXPECT_EQ(handed, (std::set<std::uint16_t>{1, 2, 3, 4}));

    disp.stop();
    srv.stop();
    fs::remove_all(dir);
}

TEST(DispatcherQueue, SweepTimerReclaimsStuckTasks)
{
    cipher::AesCbcCipher aes;
    const fs::path       dir = fs::temp_directory_path() /
                         ("chunkfarm-disp-sweep-" + std::to_string(::getpid()));
    Finalizer fin({(dir / "r").string(), (dir / "k").string(), (dir / "i").string()}, aes);
    DispatcherSettings ds;
    ds.sweep_timeout  = 20ms;
    ds.sweep_interval = 10ms;
    Dispatcher disp(fin, ds);
    ASSERT_TRUE(disp.start());

    LoopbackServer srv;
    srv.start({}, disp.callbacks());

    std::vector<job::Chunk> chunks(3);
    for (std::size_t i = 0; i < chunks.size(); i++)
    {
        chunks[i].seq = i;
        chunks[i].bytes.assign(4, 0);
    }
    disp.post(TasksLoaded{std::move(chunks)});

    // a worker takes a task and then goes quiet without disconnecting
    Conn c = srv.connect();
    srv.deliver(c, wire::encode_handshake("quiet"));
    for (int i = 0; i < 200 && c->sent_count() < 1; i++)
        std::this_thread::sleep_for(5ms);
    ASSERT_EQ(c->sent_count(), 1u);
    srv.deliver(c, wire::encode_request_task(ack_id(c->sent()[0])));
    for (int i = 0; i < 200 && c->sent_count() < 2; i++)
        std::this_thread::sleep_for(5ms);
    ASSERT_EQ(c->sent_count(), 2u);
    EXPECT_EQ(server_hdr(c->last_sent()).command, wire::CMD_TASK_DATA);

    const std::string reclaimed = "tasks=3 pending=3 assigned=0 done=0 peers=1";
    for (int i = 0; i < 400 && disp.status_line() != reclaimed; i++)
        std::this_thread::sleep_for(5ms);
    EXPECT_EQ(disp.status_line(), reclaimed);
    EXPECT_TRUE(c->is_open());

    disp.stop();
    srv.stop();
    fs::remove_all(dir);
}
