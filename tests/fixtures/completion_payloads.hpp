#pragma once

#include <string>
#include <vector>

namespace parley {
namespace testing {
namespace payloads {

// Successful single-shot completion
inline const std::string COMPLETION_OK = R"({
    "id": "chatcmpl-123",
    "object": "chat.completion",
    "created": 1677652288,
    "model": "gpt-3.5-turbo-0613",
    "choices": [{
        "index": 0,
        "message": {"role": "assistant", "content": "Hello there, how may I assist you today?"},
        "finish_reason": "stop"
    }],
    "usage": {"prompt_tokens": 9, "completion_tokens": 12, "total_tokens": 21}
})";

// Completion whose message content is null (e.g. filtered)
inline const std::string COMPLETION_NULL_CONTENT = R"({
    "id": "chatcmpl-456",
    "created": 1677652288,
    "model": "gpt-3.5-turbo",
    "choices": [{"index": 0, "message": {"role": "assistant", "content": null}, "finish_reason": "content_filter"}]
})";

// Completion without choices
inline const std::string COMPLETION_NO_CHOICES = R"({"id": "chatcmpl-789", "choices": []})";

// Error object returned with a 2xx status
inline const std::string ERROR_BODY = R"({
    "error": {
        "message": "The model `gpt-5-ultra` does not exist",
        "type": "invalid_request_error",
        "param": null,
        "code": "model_not_found"
    }
})";

inline const std::string RATE_LIMIT_BODY = R"({
    "error": {"message": "Rate limit reached for requests", "type": "requests", "code": "rate_limit_exceeded"}
})";

inline const std::string NOT_JSON = "<html><body>502 Bad Gateway</body></html>";

// A complete server-sent-events stream, one entry per line
inline const std::vector<std::string> STREAM_LINES = {
    R"(data: {"id":"chatcmpl-s1","model":"gpt-3.5-turbo","choices":[{"index":0,"delta":{"role":"assistant"},"finish_reason":null}]})",
    "",
    R"(data: {"id":"chatcmpl-s1","model":"gpt-3.5-turbo","choices":[{"index":0,"delta":{"content":"Hello"},"finish_reason":null}]})",
    "",
    R"(data: {"id":"chatcmpl-s1","model":"gpt-3.5-turbo","choices":[{"index":0,"delta":{"content":" world"},"finish_reason":null}]})",
    "",
    ": keep-alive",
    R"(data: {"id":"chatcmpl-s1","model":"gpt-3.5-turbo","choices":[{"index":0,"delta":{},"finish_reason":"stop"}]})",
    "",
    "data: [DONE]",
    ""
};

} // namespace payloads
} // namespace testing
} // namespace parley
