// Jackson Coxson

#include "fake_usbmuxd.hpp"
#include "test_support.hpp"
#include <boost/asio/steady_timer.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdlib>
#include <gtest/gtest.h>
#include <usbmux++/usbmux.hpp>

using namespace Usbmux;
using UsbmuxTest::FakeUsbmuxd;
using UsbmuxTest::RecordingHandler;
using UsbmuxTest::run_until;

namespace {

class UsbmuxConnectionTest : public ::testing::Test {
  protected:
    // Connects to the fake daemon and waits for the listen handshake.
    std::shared_ptr<UsbmuxConnection> connect() {
        Option<MuxResult<std::shared_ptr<UsbmuxConnection>>> res;
        connect_to_usbmux(io, usbmuxd.config(), [&](MuxResult<std::shared_ptr<UsbmuxConnection>> r) {
            res = Some(std::move(r));
        });
        EXPECT_TRUE(run_until(io, [&] { return res.is_some(); }));
        if (res.is_none() || res.unwrap().is_err()) {
            return nullptr;
        }
        return res.unwrap().unwrap();
    }

    MuxError connect_error(const MuxConfig& config) {
        Option<MuxError> err;
        connect_to_usbmux(io, config, [&](MuxResult<std::shared_ptr<UsbmuxConnection>> r) {
            err = Some(r.is_err() ? r.unwrap_err() : MuxError());
        });
        EXPECT_TRUE(run_until(io, [&] { return err.is_some(); }));
        return err.unwrap_or(MuxError());
    }

    // Runs connect_to_device to completion.
    MuxResult<DeviceConnection> open_device(const std::shared_ptr<UsbmuxConnection>& mux,
                                            uint32_t                                 device_id,
                                            uint16_t                                 port,
                                            std::shared_ptr<RecordingHandler>        handler) {
        Option<MuxResult<DeviceConnection>> res;
        mux->connect_to_device([handler] { return handler; },
                               device_id,
                               port,
                               [&](MuxResult<DeviceConnection> r) { res = Some(std::move(r)); });
        EXPECT_TRUE(run_until(io, [&] { return res.is_some(); }));
        if (res.is_none()) {
            return Err(MuxError::Timeout("test gave up", false));
        }
        return std::move(res).unwrap();
    }

    boost::asio::io_context io;
    FakeUsbmuxd             usbmuxd{io};
};

} // namespace

TEST_F(UsbmuxConnectionTest, ListenHandshake) {
    auto mux = connect();
    ASSERT_TRUE(mux);
    EXPECT_TRUE(mux->is_listening());
    EXPECT_EQ(mux->state(), MuxState::Listening);

    ASSERT_EQ(usbmuxd.requests.size(), 1u);
    const auto& listen = usbmuxd.requests[0];
    EXPECT_EQ(listen.type, "Listen");
    EXPECT_EQ(listen.tag, kDefaultMessageTag);
    EXPECT_EQ(listen.body.get_string("ClientVersionString").unwrap(), "usbmux++");
    EXPECT_EQ(listen.body.get_string("ProgName").unwrap(), "usbmux++");
}

TEST_F(UsbmuxConnectionTest, ListenRejectedIsConnectionFailed) {
    usbmuxd.listen_result = 5;
    MuxError err = connect_error(usbmuxd.config());
    EXPECT_EQ(err.kind, ErrorKind::ConnectionFailed);
    EXPECT_EQ(err.code, 5);
}

TEST_F(UsbmuxConnectionTest, HangUpBeforeResultFailsConnect) {
    usbmuxd.hang_up_on_listen = true;
    MuxError err = connect_error(usbmuxd.config());
    EXPECT_TRUE(err.kind == ErrorKind::ConnectionFailed || err.kind == ErrorKind::Io) << err.to_string();
}

TEST_F(UsbmuxConnectionTest, BadFrameDuringListenIsProtocolError) {
    usbmuxd.bad_frame_on_listen = true;
    MuxError err = connect_error(usbmuxd.config());
    EXPECT_EQ(err.kind, ErrorKind::ProtocolError);
    EXPECT_TRUE(run_until(io, [&] { return usbmuxd.peer_closed_count() == 1; }));
}

TEST_F(UsbmuxConnectionTest, BadFrameWhileListeningClosesTheRegistry) {
    auto mux = connect();
    ASSERT_TRUE(mux);

    Option<MuxError> err;
    mux->wait_for_attach(None, [&](MuxResult<uint32_t> r) { err = Some(r.unwrap_err()); });
    usbmuxd.send_bad_frame();
    ASSERT_TRUE(run_until(io, [&] { return err.is_some(); }));
    EXPECT_EQ(err.unwrap().kind, ErrorKind::Closed);
    EXPECT_TRUE(mux->registry()->is_closed());
    EXPECT_EQ(mux->state(), MuxState::Closed);
    EXPECT_TRUE(run_until(io, [&] { return usbmuxd.peer_closed_count() == 1; }));
}

TEST_F(UsbmuxConnectionTest, BadFrameDuringConnectAbortsTheTunnel) {
    usbmuxd.attach(5, "five");
    auto mux = connect();
    ASSERT_TRUE(mux);
    usbmuxd.bad_frame_on_connect = true;

    auto handler = std::make_shared<RecordingHandler>();
    auto res     = open_device(mux, 5, 22, handler);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(res.unwrap_err().kind, ErrorKind::ProtocolError);
    EXPECT_EQ(handler->made, 0);

    // only the device connection goes away
    EXPECT_TRUE(run_until(io, [&] { return usbmuxd.peer_closed_count() == 1; }));
    EXPECT_TRUE(mux->is_listening());
}

TEST_F(UsbmuxConnectionTest, PathOverloadUsesThePathOnUnix) {
    Option<MuxResult<std::shared_ptr<UsbmuxConnection>>> res;
    // nothing listens on port 1; a Unix build must not try it
    connect_to_usbmux(io, Some(usbmuxd.path()), Some(uint16_t(1)), [&](MuxResult<std::shared_ptr<UsbmuxConnection>> r) {
        res = Some(std::move(r));
    });
    ASSERT_TRUE(run_until(io, [&] { return res.is_some(); }));
    ASSERT_TRUE(res.unwrap().is_ok()) << res.unwrap().unwrap_err().to_string();
    EXPECT_TRUE(res.unwrap().unwrap()->is_listening());
}

TEST_F(UsbmuxConnectionTest, PortAloneFallsBackToTheDefaultSocketOnUnix) {
    const char*         old   = std::getenv(kSocketAddressEnv);
    Option<std::string> saved = old ? Some(std::string(old)) : Option<std::string>(None);
    setenv(kSocketAddressEnv, ("UNIX:" + usbmuxd.path()).c_str(), 1);

    Option<MuxResult<std::shared_ptr<UsbmuxConnection>>> res;
    connect_to_usbmux(io, None, Some(uint16_t(1)), [&](MuxResult<std::shared_ptr<UsbmuxConnection>> r) {
        res = Some(std::move(r));
    });
    bool done = run_until(io, [&] { return res.is_some(); });

    if (saved.is_some()) {
        setenv(kSocketAddressEnv, saved.unwrap().c_str(), 1);
    } else {
        unsetenv(kSocketAddressEnv);
    }

    ASSERT_TRUE(done);
    ASSERT_TRUE(res.unwrap().is_ok()) << res.unwrap().unwrap_err().to_string();
    EXPECT_EQ(res.unwrap().unwrap()->config().addr.path(), usbmuxd.path());
}

TEST_F(UsbmuxConnectionTest, MissingDaemonIsIoError) {
    MuxConfig config;
    config.addr  = MuxAddr::unix_new("/tmp/usbmuxpp-test-nobody-listens.sock").expect("addr");
    MuxError err = connect_error(config);
    EXPECT_EQ(err.kind, ErrorKind::Io);
    EXPECT_FALSE(err.is_usbmux_error());
}

TEST_F(UsbmuxConnectionTest, AttachAndDetachReachTheRegistry) {
    usbmuxd.attach(1, "first");
    auto mux = connect();
    ASSERT_TRUE(mux);

    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->contains(1); }));
    auto attached = mux->attached();
    EXPECT_EQ(attached.at(1).get_string("SerialNumber").unwrap(), "first");

    std::vector<uint32_t> detached;
    mux->registry()->add_detach_listener([&](uint32_t id) { detached.push_back(id); });

    usbmuxd.attach(2, "second");
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->contains(2); }));

    usbmuxd.detach(1);
    ASSERT_TRUE(run_until(io, [&] { return !detached.empty(); }));
    EXPECT_EQ(mux->registry()->device_ids(), std::vector<uint32_t>{2});
}

TEST_F(UsbmuxConnectionTest, WaitForAttachResolvesWithNewDevice) {
    auto mux = connect();
    ASSERT_TRUE(mux);

    Option<uint32_t> got;
    mux->wait_for_attach(Some(Millis(2000)), [&](MuxResult<uint32_t> r) { got = Some(r.expect("wait")); });
    usbmuxd.attach(7, "seven");
    ASSERT_TRUE(run_until(io, [&] { return got.is_some(); }));
    EXPECT_EQ(got.unwrap(), 7u);
}

TEST_F(UsbmuxConnectionTest, ConnectSwitchesToPassthrough) {
    usbmuxd.attach(5, "five");
    // looks like a frame header but must reach the application untouched
    const std::string trailing("\x20\x00\x00\x00\x01\x00\x00\x00raw device bytes", 24);
    usbmuxd.after_connect = trailing;

    auto mux = connect();
    ASSERT_TRUE(mux);
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->contains(5); }));

    auto handler = std::make_shared<RecordingHandler>();
    auto res     = open_device(mux, 5, 62078, handler);
    ASSERT_TRUE(res.is_ok()) << res.unwrap_err().to_string();

    DeviceConnection& conn = res.unwrap();
    EXPECT_EQ(conn.device_id, 5u);
    EXPECT_EQ(conn.handler, handler);
    EXPECT_EQ(conn.device_info.get_string("SerialNumber").unwrap(), "five");

    ASSERT_TRUE(run_until(io, [&] { return handler->data.size() == trailing.size(); }));
    EXPECT_EQ(handler->data, trailing);
    EXPECT_EQ(handler->made, 1);

    // the request carried the port in network byte order
    const auto& req = usbmuxd.requests.back();
    EXPECT_EQ(req.type, "Connect");
    EXPECT_EQ(req.body.get_uint("DeviceID").unwrap(), 5u);
    EXPECT_EQ(req.body.get_uint("PortNumber").unwrap(), boost::endian::native_to_big(uint16_t(62078)));
    EXPECT_NE(req.tag, kDefaultMessageTag);

    // and the tunnel carries bytes the other way too
    const std::string hello = "ping";
    conn.transport->write(reinterpret_cast<const uint8_t*>(hello.data()), hello.size());
    auto tunnel = usbmuxd.tunnel();
    ASSERT_TRUE(tunnel);
    EXPECT_TRUE(run_until(io, [&] { return tunnel->raw_in == hello; }));

    // the listen connection is unaffected
    EXPECT_TRUE(mux->is_listening());
}

TEST_F(UsbmuxConnectionTest, EachConnectUsesAFreshTag) {
    usbmuxd.attach(5, "five");
    auto mux = connect();
    ASSERT_TRUE(mux);

    ASSERT_TRUE(open_device(mux, 5, 1000, std::make_shared<RecordingHandler>()).is_ok());
    ASSERT_TRUE(open_device(mux, 5, 1001, std::make_shared<RecordingHandler>()).is_ok());

    ASSERT_EQ(usbmuxd.requests.size(), 3u);
    EXPECT_NE(usbmuxd.requests[1].tag, usbmuxd.requests[2].tag);
}

TEST_F(UsbmuxConnectionTest, ResultWithOtherTagIsIgnored) {
    usbmuxd.attach(5, "five");
    usbmuxd.stray_result_first = true;
    auto mux = connect();
    ASSERT_TRUE(mux);

    auto res = open_device(mux, 5, 22, std::make_shared<RecordingHandler>());
    EXPECT_TRUE(res.is_ok());
}

TEST_F(UsbmuxConnectionTest, ResultNumbersMapToErrors) {
    usbmuxd.attach(1, "one");
    usbmuxd.connect_results[1] = 3;
    auto mux = connect();
    ASSERT_TRUE(mux);

    auto refused = open_device(mux, 1, 22, std::make_shared<RecordingHandler>());
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.unwrap_err().kind, ErrorKind::ConnectionRefused);

    // not attached at all
    auto missing = open_device(mux, 42, 22, std::make_shared<RecordingHandler>());
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.unwrap_err().kind, ErrorKind::DeviceNotConnected);

    usbmuxd.connect_results[1] = 99;
    auto odd = open_device(mux, 1, 22, std::make_shared<RecordingHandler>());
    ASSERT_TRUE(odd.is_err());
    EXPECT_EQ(odd.unwrap_err().kind, ErrorKind::ConnectionFailed);
    EXPECT_EQ(odd.unwrap_err().code, 99);

    // device failures leave the listen connection alone
    EXPECT_TRUE(mux->is_listening());
}

TEST_F(UsbmuxConnectionTest, FirstDeviceSkipsRefusedDevice) {
    usbmuxd.attach(1, "one");
    usbmuxd.attach(2, "two");
    usbmuxd.connect_results[1] = 3;
    auto mux = connect();
    ASSERT_TRUE(mux);
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->size() == 2; }));

    auto                                handler = std::make_shared<RecordingHandler>();
    Option<MuxResult<DeviceConnection>> res;
    mux->connect_to_first_device([handler] { return handler; },
                                 22,
                                 Some(Millis(1000)),
                                 [&](MuxResult<DeviceConnection> r) { res = Some(std::move(r)); });
    ASSERT_TRUE(run_until(io, [&] { return res.is_some(); }));
    ASSERT_TRUE(res.unwrap().is_ok());
    EXPECT_EQ(res.unwrap().unwrap().device_id, 2u);
    EXPECT_EQ(usbmuxd.connect_count(1), 1u);
    EXPECT_EQ(usbmuxd.connect_count(2), 1u);
}

TEST_F(UsbmuxConnectionTest, FirstDeviceHonorsFilter) {
    usbmuxd.attach(1, "one");
    usbmuxd.attach(2, "two");
    auto mux = connect();
    ASSERT_TRUE(mux);
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->size() == 2; }));

    DeviceFilter filter;
    filter.exclude.insert(1);

    Option<MuxResult<DeviceConnection>> res;
    mux->connect_to_first_device([] { return std::make_shared<RecordingHandler>(); },
                                 22,
                                 Some(Millis(1000)),
                                 [&](MuxResult<DeviceConnection> r) { res = Some(std::move(r)); },
                                 filter);
    ASSERT_TRUE(run_until(io, [&] { return res.is_some(); }));
    ASSERT_TRUE(res.unwrap().is_ok());
    EXPECT_EQ(res.unwrap().unwrap().device_id, 2u);
    EXPECT_EQ(usbmuxd.connect_count(1), 0u);
}

TEST_F(UsbmuxConnectionTest, FirstDeviceWaitsForLateAttach) {
    auto mux = connect();
    ASSERT_TRUE(mux);

    boost::asio::steady_timer later(io, Millis(50));
    later.async_wait([&](const boost::system::error_code&) { usbmuxd.attach(3, "three"); });

    Option<MuxResult<DeviceConnection>> res;
    mux->connect_to_first_device([] { return std::make_shared<RecordingHandler>(); },
                                 22,
                                 Some(Millis(2000)),
                                 [&](MuxResult<DeviceConnection> r) { res = Some(std::move(r)); });
    ASSERT_TRUE(run_until(io, [&] { return res.is_some(); }, Millis(3000)));
    ASSERT_TRUE(res.unwrap().is_ok());
    EXPECT_EQ(res.unwrap().unwrap().device_id, 3u);
}

TEST_F(UsbmuxConnectionTest, FirstDeviceTimeoutReportsWhatItSaw) {
    auto mux = connect();
    ASSERT_TRUE(mux);

    Option<MuxResult<DeviceConnection>> none_seen;
    mux->connect_to_first_device([] { return std::make_shared<RecordingHandler>(); },
                                 22,
                                 Some(Millis(30)),
                                 [&](MuxResult<DeviceConnection> r) { none_seen = Some(std::move(r)); });
    ASSERT_TRUE(run_until(io, [&] { return none_seen.is_some(); }));
    ASSERT_TRUE(none_seen.unwrap().is_err());
    EXPECT_EQ(none_seen.unwrap().unwrap_err().kind, ErrorKind::Timeout);
    EXPECT_FALSE(none_seen.unwrap().unwrap_err().found_any());

    usbmuxd.connect_results[1] = 3;
    usbmuxd.attach(1, "one");
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->contains(1); }));

    Option<MuxResult<DeviceConnection>> refused;
    mux->connect_to_first_device([] { return std::make_shared<RecordingHandler>(); },
                                 22,
                                 Some(Millis(100)),
                                 [&](MuxResult<DeviceConnection> r) { refused = Some(std::move(r)); });
    ASSERT_TRUE(run_until(io, [&] { return refused.is_some(); }));
    ASSERT_TRUE(refused.unwrap().is_err());
    EXPECT_EQ(refused.unwrap().unwrap_err().kind, ErrorKind::Timeout);
    EXPECT_TRUE(refused.unwrap().unwrap_err().found_any());
}

TEST_F(UsbmuxConnectionTest, FirstDeviceStopsOnceTheBudgetIsSpent) {
    usbmuxd.attach(1, "one");
    usbmuxd.attach(2, "two");
    // whichever device goes first answers late, and with a refusal
    usbmuxd.connect_results[1] = 3;
    usbmuxd.connect_results[2] = 3;
    usbmuxd.connect_delays[1]  = Millis(150);
    usbmuxd.connect_delays[2]  = Millis(150);
    auto mux = connect();
    ASSERT_TRUE(mux);
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->size() == 2; }));

    Option<MuxResult<DeviceConnection>> res;
    mux->connect_to_first_device([] { return std::make_shared<RecordingHandler>(); },
                                 22,
                                 Some(Millis(50)),
                                 [&](MuxResult<DeviceConnection> r) { res = Some(std::move(r)); });
    ASSERT_TRUE(run_until(io, [&] { return res.is_some(); }));
    ASSERT_TRUE(res.unwrap().is_err());
    EXPECT_EQ(res.unwrap().unwrap_err().kind, ErrorKind::Timeout);
    EXPECT_TRUE(res.unwrap().unwrap_err().found_any());
    EXPECT_EQ(usbmuxd.connect_count(1) + usbmuxd.connect_count(2), 1u);
}

TEST_F(UsbmuxConnectionTest, WaitForSerialIgnoresCase) {
    usbmuxd.attach(4, "00008030-ABCDEF");
    auto mux = connect();
    ASSERT_TRUE(mux);
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->contains(4); }));

    Option<MuxResult<uint32_t>> found;
    mux->wait_for_serial("00008030-abcdef", Some(Millis(0)), [&](MuxResult<uint32_t> r) {
        found = Some(std::move(r));
    });
    ASSERT_TRUE(run_until(io, [&] { return found.is_some(); }));
    ASSERT_TRUE(found.unwrap().is_ok());
    EXPECT_EQ(found.unwrap().unwrap(), 4u);

    Option<MuxResult<uint32_t>> missing;
    mux->wait_for_serial("nope", Some(Millis(0)), [&](MuxResult<uint32_t> r) { missing = Some(std::move(r)); });
    ASSERT_TRUE(run_until(io, [&] { return missing.is_some(); }));
    ASSERT_TRUE(missing.unwrap().is_err());
    EXPECT_EQ(missing.unwrap().unwrap_err().kind, ErrorKind::Timeout);
}

TEST_F(UsbmuxConnectionTest, CloseEndsTheEventStream) {
    auto mux = connect();
    ASSERT_TRUE(mux);

    Option<MuxError> err;
    mux->wait_for_attach(None, [&](MuxResult<uint32_t> r) { err = Some(r.unwrap_err()); });
    mux->close();
    ASSERT_TRUE(run_until(io, [&] { return err.is_some(); }));
    EXPECT_EQ(err.unwrap().kind, ErrorKind::Closed);
    EXPECT_FALSE(mux->is_listening());
    EXPECT_TRUE(mux->registry()->is_closed());
}

TEST_F(UsbmuxConnectionTest, DaemonGoingAwayClosesTheRegistry) {
    usbmuxd.attach(1, "one");
    auto mux = connect();
    ASSERT_TRUE(mux);
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->contains(1); }));

    usbmuxd.shutdown();
    ASSERT_TRUE(run_until(io, [&] { return mux->registry()->is_closed(); }));
    EXPECT_EQ(mux->state(), MuxState::Closed);
    // the last known devices stay visible
    EXPECT_TRUE(mux->registry()->contains(1));
}
