#include "../include/protocol.hpp"
#include "../include/errors.hpp"
#include "../include/utils.hpp"
#include <stdexcept>

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optionalField(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

}

json protocol::encodeEvent(const Event& event) {
    return {
        {"placa", event.plate},
        {"tipo", toString(event.kind)},
        {"timestamp", event.timestamp},
        {"confianca_lpr", event.confidence},
        {"andar", event.floor},
        {"status", toString(event.status)},
        {"valor_calculado", optionalToJson(event.fee)},
        {"tempo_permanencia_minutos", optionalToJson(event.durationMinutes)},
        {"erro_descricao", optionalToJson(event.errorDescription)}
    };
}

json protocol::encodeResponse(const EventResponse& response) {
    return {
        {"evento_id", response.eventId},
        {"sucesso", response.success},
        {"acao", toString(response.action)},
        {"valor", optionalToJson(response.fee)},
        {"tempo_permanencia", optionalToJson(response.durationMinutes)},
        {"mensagem", optionalToJson(response.message)}
    };
}

Event protocol::decodeEvent(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError("event must be a JSON object");
    }
    try {
        Event event;
        event.plate = j.at("placa").get<std::string>();
        event.kind = eventKindFromString(j.at("tipo").get<std::string>());
        event.timestamp = j.at("timestamp").get<std::string>();
        utils::isoStringToTime(event.timestamp);
        event.confidence = j.at("confianca_lpr").get<double>();
        if (event.confidence < 0.0 || event.confidence > 1.0) {
            throw ProtocolError("confianca_lpr out of range");
        }
        event.floor = j.value("andar", std::string("terreo"));
        event.status = eventStatusFromString(j.value("status", std::string("pendente")));
        event.fee = optionalField<double>(j, "valor_calculado");
        event.durationMinutes = optionalField<int>(j, "tempo_permanencia_minutos");
        event.errorDescription = optionalField<std::string>(j, "erro_descricao");
        return event;
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("invalid event: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(std::string("invalid event: ") + e.what());
    }
}

EventResponse protocol::decodeResponse(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError("response must be a JSON object");
    }
    try {
        EventResponse response;
        response.eventId = j.at("evento_id").get<std::string>();
        response.success = j.at("sucesso").get<bool>();
        response.action = gateActionFromString(j.at("acao").get<std::string>());
        response.fee = optionalField<double>(j, "valor");
        response.durationMinutes = optionalField<int>(j, "tempo_permanencia");
        response.message = optionalField<std::string>(j, "mensagem");
        return response;
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("invalid response: ") + e.what());
    }
}

std::string protocol::toLine(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

json protocol::parseLine(const std::string& line) {
    try {
        return json::parse(line);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("malformed JSON: ") + e.what());
    }
}
