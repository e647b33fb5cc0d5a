#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace transport
{

using Frame  = std::vector<std::uint8_t>;
using ConnId = std::uint64_t;

// One live worker link. send() carries exactly one protocol message.
struct IConnection
{
    virtual ConnId      id() const                  = 0;
    virtual bool        send(const Frame &message) = 0;
    virtual bool        is_open() const             = 0;
    virtual void        close()                     = 0;
    virtual std::string name() const { return ""; }
    virtual ~IConnection() = default;
};

using ConnPtr   = std::shared_ptr<IConnection>;
using OnConnect = std::function<void(const ConnPtr &)>;
using OnMessage = std::function<void(const ConnPtr &, Frame)>;
using OnClose   = std::function<void(const ConnPtr &)>;

struct Callbacks
{
    OnConnect on_connect;
    OnMessage on_message;
    OnClose   on_close;
};

struct Settings
{
    std::string   bind_addr = "0.0.0.0";
    std::uint16_t port      = 0;  // 0 = ephemeral
};

struct IServerTransport
{
    virtual bool          start(const Settings &s, Callbacks cb) = 0;
    virtual void          stop()                                 = 0;
    virtual std::uint16_t port() const                           = 0;  // bound port
    virtual std::string   name() const { return ""; }
    virtual ~IServerTransport() = default;
};

}  // namespace transport
