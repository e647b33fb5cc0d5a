#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

/*
worker -> server   [u16 peer_id][u16 command][body]
                     0 handshake      body = JSON {nickname?}
                     1 request-task   body = JSON {}
                     2 submit-result  body = JSON {taskId, result: base64}

server -> worker   [u16 peer_id]                        handshake ack, 2 bytes, no header
                   [u16 command][u16 value][body]
                     100 task-data    value = task id, body = raw chunk bytes
                     101 status       value = 0,       body = JSON {type, message?}
*/

namespace wire
{

using Frame = std::vector<std::uint8_t>;

// --- Protocol constants ---
inline constexpr std::size_t   HDR_SIZE          = 4;
inline constexpr std::size_t   ACK_SIZE          = 2;
inline constexpr std::uint16_t CMD_HANDSHAKE     = 0;
inline constexpr std::uint16_t CMD_REQUEST_TASK  = 1;
inline constexpr std::uint16_t CMD_SUBMIT_RESULT = 2;
inline constexpr std::uint16_t CMD_TASK_DATA     = 100;
inline constexpr std::uint16_t CMD_STATUS        = 101;

inline constexpr std::string_view STATUS_NO_TASK    = "no-task";
inline constexpr std::string_view STATUS_COMPLETION = "completion";

// worker -> server header
struct Header
{
    std::uint16_t peer_id{0};  // 2B, ignored on handshake
    std::uint16_t command{0};  // 2B
};

// server -> worker header
struct ServerHeader
{
    std::uint16_t command{0};  // 2B
    std::uint16_t value{0};    // 2B, task id for task-data
};

// Bodies are a tagged union keyed by command id: JSON text or raw bytes.
struct JsonBody
{
    nlohmann::json doc;
};

struct RawBody
{
    std::vector<std::uint8_t> bytes;
};

using Body = std::variant<JsonBody, RawBody>;

enum class BodyKind
{
    Json,
    Raw
};

BodyKind body_kind(std::uint16_t command);

// typed views of JSON bodies
struct Handshake
{
    std::optional<std::string> nickname;
};

// empty object; anything else is malformed
struct RequestTask
{
};

struct SubmitResult
{
    std::uint32_t             task_id{0};
    std::vector<std::uint8_t> result;
};

struct Status
{
    std::string type;
    std::string message;
};

// --- header codec ---
void pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);
void unpack_header(const std::uint8_t in[HDR_SIZE], Header &out);
void pack_server_header(const ServerHeader &in, std::uint8_t out[HDR_SIZE]);
void unpack_server_header(const std::uint8_t in[HDR_SIZE], ServerHeader &out);

// nullopt if the frame is shorter than a header
std::optional<Header>       parse_header(const Frame &frame);
std::optional<ServerHeader> parse_server_header(const Frame &frame);

// --- body decoders ---
// decode the bytes after the header with the decoder for this command
std::optional<Body> decode_body(std::uint16_t command, const std::uint8_t *data, std::size_t len);
std::optional<Body> decode_body(std::uint16_t command, const Frame &frame);  // skips header

std::optional<Handshake>    as_handshake(const Body &b);
std::optional<RequestTask>  as_request_task(const Body &b);
std::optional<SubmitResult> as_submit_result(const Body &b);
std::optional<Status>       as_status(const Body &b);

// --- encoders ---
Frame encode_ack(std::uint16_t peer_id);
Frame encode_handshake(std::string_view nickname);
Frame encode_request_task(std::uint16_t peer_id);
Frame encode_submit_result(std::uint16_t                    peer_id,
                           std::uint32_t                    task_id,
                           const std::vector<std::uint8_t> &result);
Frame encode_task_data(std::uint16_t task_id, const std::vector<std::uint8_t> &payload);
Frame encode_status(std::string_view type, std::string_view message);
Frame encode_no_task();
Frame encode_completion(std::string_view message);

// --- base64 (libsodium, original alphabet with padding) ---
std::string                              to_base64(const std::vector<std::uint8_t> &bytes);
std::optional<std::vector<std::uint8_t>> from_base64(std::string_view text);

}  // namespace wire
