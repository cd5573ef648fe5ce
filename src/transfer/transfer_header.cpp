/**
 * TransferHeader validation and the data-channel message codec.
 */

#include "transfer/transfer_header.h"

#include <utility>

using json = nlohmann::json;

TransferHeader TransferHeader::describe(const std::string& filename,
                                        uint64_t length,
                                        uint64_t chunk_size,
                                        const std::string& checksum) {
    TransferHeader header;
    header.filename = filename;
    header.length = length;
    header.chunk_size = chunk_size;
    header.chunk_count = chunk_count_for(length, chunk_size);
    header.checksum = checksum;
    return header;
}

uint64_t TransferHeader::chunk_count_for(uint64_t length, uint64_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return length / chunk_size + (length % chunk_size != 0 ? 1 : 0);
}

void TransferHeader::validate() const {
    if (chunk_size == 0) {
        throw TransferException(TransferError::protocol_violation, "header declares a zero chunk size");
    }
    if (chunk_count != chunk_count_for(length, chunk_size)) {
        throw TransferException(TransferError::protocol_violation,
            "header declares " + std::to_string(chunk_count) + " chunks for " +
            std::to_string(length) + " bytes");
    }
    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos ||
        filename.find('\0') != std::string::npos) {
        throw TransferException(TransferError::protocol_violation,
            "header file name '" + filename + "' is not a plain file name");
    }
    try {
        (void)json(filename).dump();
    } catch (const json::type_error&) {
        throw TransferException(TransferError::protocol_violation, "header file name is not valid UTF-8");
    }
}

uint64_t TransferHeader::chunk_length(uint64_t sequence) const {
    if (sequence + 1 < chunk_count) {
        return chunk_size;
    }
    return length - chunk_size * (chunk_count - 1);
}

json TransferHeader::to_json() const {
    return {
        {"filename", filename},
        {"filesize", length},
        {"chunk_size", chunk_size},
        {"chunk_count", chunk_count},
        {"checksum", checksum},
    };
}

TransferHeader TransferHeader::from_json(const json& j) {
    try {
        TransferHeader header;
        header.filename = j.at("filename").get<std::string>();
        header.length = j.at("filesize").get<uint64_t>();
        header.chunk_size = j.at("chunk_size").get<uint64_t>();
        header.chunk_count = j.at("chunk_count").get<uint64_t>();
        header.checksum = j.value("checksum", "");
        return header;
    } catch (const json::exception& e) {
        throw TransferException(TransferError::protocol_violation,
                                std::string("malformed transfer header: ") + e.what());
    }
}

namespace {

Bytes tagged_json(MessageType type, const json& body) {
    std::string text = body.dump(-1, ' ', false, json::error_handler_t::replace);
    Bytes out;
    out.reserve(1 + text.size());
    out.push_back(static_cast<uint8_t>(type));
    out.insert(out.end(), text.begin(), text.end());
    return out;
}

json json_body(const Bytes& message) {
    json body = json::parse(message.begin() + 1, message.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw TransferException(TransferError::protocol_violation, "message body is not a JSON object");
    }
    return body;
}

} // namespace

Bytes MessageCodec::encode_header(const TransferHeader& header) {
    return tagged_json(MessageType::header, header.to_json());
}

Bytes MessageCodec::encode_chunk(uint64_t sequence, const uint8_t* data, std::size_t size) {
    Bytes out;
    out.reserve(kChunkOverhead + size);
    out.push_back(static_cast<uint8_t>(MessageType::chunk));
    put_u64(out, sequence);
    out.insert(out.end(), data, data + size);
    return out;
}

Bytes MessageCodec::encode_complete(const std::string& checksum) {
    return tagged_json(MessageType::complete, json{{"checksum", checksum}});
}

Bytes MessageCodec::encode_keepalive(uint64_t assembled, uint64_t total) {
    return tagged_json(MessageType::keepalive, json{{"assembled", assembled}, {"total", total}});
}

Bytes MessageCodec::encode_verdict(TransferError result, const std::string& detail) {
    std::string name = result == TransferError::none ? "ok" : to_string(result);
    return tagged_json(MessageType::verdict, json{{"result", name}, {"detail", detail}});
}

DecodedMessage MessageCodec::decode(Bytes message) {
    if (message.empty()) {
        throw TransferException(TransferError::protocol_violation, "empty channel message");
    }

    DecodedMessage decoded;
    switch (message.front()) {
        case static_cast<uint8_t>(MessageType::header):
            decoded.type = MessageType::header;
            decoded.header = TransferHeader::from_json(json_body(message));
            break;

        case static_cast<uint8_t>(MessageType::chunk):
            if (message.size() < kChunkOverhead) {
                throw TransferException(TransferError::protocol_violation, "truncated chunk message");
            }
            decoded.type = MessageType::chunk;
            decoded.chunk.sequence = get_u64(message.data() + 1);
            message.erase(message.begin(), message.begin() + kChunkOverhead);
            decoded.chunk.payload = std::move(message);
            break;

        case static_cast<uint8_t>(MessageType::complete): {
            decoded.type = MessageType::complete;
            json body = json_body(message);
            if (!body.contains("checksum") || !body.at("checksum").is_string()) {
                throw TransferException(TransferError::protocol_violation, "completion marker without checksum");
            }
            decoded.checksum = body.at("checksum").get<std::string>();
            break;
        }

        case static_cast<uint8_t>(MessageType::keepalive): {
            decoded.type = MessageType::keepalive;
            json body = json_body(message);
            decoded.assembled = body.value("assembled", uint64_t{0});
            decoded.total = body.value("total", uint64_t{0});
            break;
        }

        case static_cast<uint8_t>(MessageType::verdict): {
            decoded.type = MessageType::verdict;
            json body = json_body(message);
            std::string result = body.value("result", "");
            if (result == "ok") {
                decoded.verdict = TransferError::none;
            } else {
                decoded.verdict = transfer_error_from_string(result);
                if (decoded.verdict == TransferError::none || result != to_string(decoded.verdict)) {
                    throw TransferException(TransferError::protocol_violation,
                        "verdict result '" + result + "' is not a known outcome");
                }
            }
            decoded.detail = body.value("detail", "");
            break;
        }

        default:
            throw TransferException(TransferError::protocol_violation,
                "unknown message tag " + std::to_string(message.front()));
    }
    return decoded;
}
