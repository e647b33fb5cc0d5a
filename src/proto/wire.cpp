#include <arpa/inet.h>  // htons, ntohs
#include <cstring>
#include <sodium.h>

#include "proto/wire.hpp"
#include "util/log.hpp"

namespace wire
{

BodyKind body_kind(std::uint16_t command)
{
    // only task payload delivery skips the text encoding
    return command == CMD_TASK_DATA ? BodyKind::Raw : BodyKind::Json;
}

static void put_u16(std::uint8_t *out, std::uint16_t v)
{
    std::uint16_t be = htons(v);
    std::memcpy(out, &be, sizeof be);
}

static std::uint16_t get_u16(const std::uint8_t *in)
{
    std::uint16_t be;
    std::memcpy(&be, in, sizeof be);
    return ntohs(be);
}

void pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    put_u16(out, in.peer_id);
    put_u16(out + 2, in.command);
}

void unpack_header(const std::uint8_t in[HDR_SIZE], Header &out)
{
    out.peer_id = get_u16(in);
    out.command = get_u16(in + 2);
}

void pack_server_header(const ServerHeader &in, std::uint8_t out[HDR_SIZE])
{
    put_u16(out, in.command);
    put_u16(out + 2, in.value);
}

void unpack_server_header(const std::uint8_t in[HDR_SIZE], ServerHeader &out)
{
    out.command = get_u16(in);
    out.value   = get_u16(in + 2);
}

std::optional<Header> parse_header(const Frame &frame)
{
    if (frame.size() < HDR_SIZE)
    {
        LOG_WARN("parse_header: frame too short (%zu)", frame.size());
        return std::nullopt;
    }
    Header h{};
    unpack_header(frame.data(), h);
    return h;
}

std::optional<ServerHeader> parse_server_header(const Frame &frame)
{
    if (frame.size() < HDR_SIZE)
    {
        LOG_WARN("parse_server_header: frame too short (%zu)", frame.size());
        return std::nullopt;
    }
    ServerHeader h{};
    unpack_server_header(frame.data(), h);
    return h;
}

std::optional<Body> decode_body(std::uint16_t command, const std::uint8_t *data, std::size_t len)
{
    if (body_kind(command) == BodyKind::Raw)
    {
        RawBody r;
        if (len)
            r.bytes.assign(data, data + len);
        return Body{std::move(r)};
    }

    // an empty text body reads as {}
    if (len == 0)
        return Body{JsonBody{nlohmann::json::object()}};
    try
    {
        const char *p = reinterpret_cast<const char *>(data);
        return Body{JsonBody{nlohmann::json::parse(p, p + len)}};
    }
    catch (const nlohmann::json::exception &e)
    {
        LOG_WARN("decode_body: bad JSON for command %u: %s", (unsigned)command, e.what());
        return std::nullopt;
    }
}

std::optional<Body> decode_body(std::uint16_t command, const Frame &frame)
{
    if (frame.size() < HDR_SIZE)
        return std::nullopt;
    return decode_body(command, frame.data() + HDR_SIZE, frame.size() - HDR_SIZE);
}

std::optional<Handshake> as_handshake(const Body &b)
{
    const auto *j = std::get_if<JsonBody>(&b);
    if (!j || !j->doc.is_object())
        return std::nullopt;
    Handshake h;
    auto      it = j->doc.find("nickname");
    if (it != j->doc.end() && it->is_string())
        h.nickname = it->get<std::string>();
    return h;
}

std::optional<RequestTask> as_request_task(const Body &b)
{
    const auto *j = std::get_if<JsonBody>(&b);
    if (!j || !j->doc.is_object())
        return std::nullopt;
    return RequestTask{};
}

std::optional<SubmitResult> as_submit_result(const Body &b)
{
    const auto *j = std::get_if<JsonBody>(&b);
    if (!j || !j->doc.is_object())
        return std::nullopt;

    auto id_it  = j->doc.find("taskId");
    auto res_it = j->doc.find("result");
    if (id_it == j->doc.end() || !id_it->is_number_integer())
    {
        LOG_WARN("as_submit_result: missing or non-integer taskId");
        return std::nullopt;
    }
    if (res_it == j->doc.end() || !res_it->is_string())
    {
        LOG_WARN("as_submit_result: result is not a string");
        return std::nullopt;
    }
    const auto id = id_it->get<long long>();
    if (id < 0 || id > 0xFFFFFFFFll)
    {
        LOG_WARN("as_submit_result: taskId out of range (%lld)", id);
        return std::nullopt;
    }

    auto bytes = from_base64(res_it->get_ref<const std::string &>());
    if (!bytes)
    {
        LOG_WARN("as_submit_result: invalid base64 for task #%lld", id);
        return std::nullopt;
    }
    SubmitResult s;
    s.task_id = static_cast<std::uint32_t>(id);
    s.result  = std::move(*bytes);
    return s;
}

std::optional<Status> as_status(const Body &b)
{
    const auto *j = std::get_if<JsonBody>(&b);
    if (!j || !j->doc.is_object())
        return std::nullopt;
    auto t = j->doc.find("type");
    if (t == j->doc.end() || !t->is_string())
        return std::nullopt;
    Status s;
    s.type = t->get<std::string>();
    auto m = j->doc.find("message");
    if (m != j->doc.end() && m->is_string())
        s.message = m->get<std::string>();
    return s;
}

// header + JSON text
static Frame json_frame(const std::uint8_t hdr[HDR_SIZE], const nlohmann::json &doc)
{
    // invalid UTF-8 (e.g. from a nickname) is replaced rather than thrown
    const std::string text = doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    Frame             out(HDR_SIZE + text.size());
    std::memcpy(out.data(), hdr, HDR_SIZE);
    if (!text.empty())
        std::memcpy(out.data() + HDR_SIZE, text.data(), text.size());
    return out;
}

Frame encode_ack(std::uint16_t peer_id)
{
    Frame out(ACK_SIZE);
    put_u16(out.data(), peer_id);
    return out;
}

Frame encode_handshake(std::string_view nickname)
{
    std::uint8_t hdr[HDR_SIZE];
    pack_header(Header{0, CMD_HANDSHAKE}, hdr);
    nlohmann::json doc = nlohmann::json::object();
    if (!nickname.empty())
        doc["nickname"] = std::string(nickname);
    return json_frame(hdr, doc);
}

Frame encode_request_task(std::uint16_t peer_id)
{
    std::uint8_t hdr[HDR_SIZE];
    pack_header(Header{peer_id, CMD_REQUEST_TASK}, hdr);
    return json_frame(hdr, nlohmann::json::object());
}

Frame encode_submit_result(std::uint16_t                    peer_id,
                           std::uint32_t                    task_id,
                           const std::vector<std::uint8_t> &result)
{
    std::uint8_t hdr[HDR_SIZE];
    pack_header(Header{peer_id, CMD_SUBMIT_RESULT}, hdr);
    nlohmann::json doc;
    doc["taskId"] = task_id;
    doc["result"] = to_base64(result);
    return json_frame(hdr, doc);
}

Frame encode_task_data(std::uint16_t task_id, const std::vector<std::uint8_t> &payload)
{
    Frame out(HDR_SIZE + payload.size());
    pack_server_header(ServerHeader{CMD_TASK_DATA, task_id}, out.data());
    if (!payload.empty())
        std::memcpy(out.data() + HDR_SIZE, payload.data(), payload.size());
    return out;
}

Frame encode_status(std::string_view type, std::string_view message)
{
    std::uint8_t hdr[HDR_SIZE];
    pack_server_header(ServerHeader{CMD_STATUS, 0}, hdr);
    nlohmann::json doc;
    doc["type"] = std::string(type);
    if (!message.empty())
        doc["message"] = std::string(message);
    return json_frame(hdr, doc);
}

Frame encode_no_task()
{
    return encode_status(STATUS_NO_TASK, "No tasks currently available.");
}

Frame encode_completion(std::string_view message)
{
    return encode_status(STATUS_COMPLETION, message);
}

std::string to_base64(const std::vector<std::uint8_t> &bytes)
{
    const int   variant = sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(bytes.size(), variant), '\0');
    sodium_bin2base64(out.data(), out.size(), bytes.data(), bytes.size(), variant);
    out.resize(std::strlen(out.c_str()));  // drop the terminator
    return out;
}

std::optional<std::vector<std::uint8_t>> from_base64(std::string_view text)
{
    std::vector<std::uint8_t> out(text.size() / 4 * 3 + 3);
    std::size_t               real_len = 0;
    const char               *end      = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &real_len,
                          &end, sodium_base64_VARIANT_ORIGINAL) != 0)
        return std::nullopt;
    // trailing garbage is not base64
    if (end != text.data() + text.size())
        return std::nullopt;
    out.resize(real_len);
    return out;
}

}  // namespace wire
