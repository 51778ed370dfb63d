#include "../include/event.hpp"
#include "../include/errors.hpp"

std::string toString(EventKind kind) {
    switch (kind) {
        case EventKind::Entry: return "entrada";
        case EventKind::Exit: return "saida";
        case EventKind::Error: return "erro";
        case EventKind::Maintenance: return "manutencao";
    }
    return "erro";
}

std::string toString(EventStatus status) {
    switch (status) {
        case EventStatus::Pending: return "pendente";
        case EventStatus::Processing: return "processando";
        case EventStatus::Completed: return "concluido";
        case EventStatus::Error: return "erro";
    }
    return "erro";
}

std::string toString(GateAction action) {
    switch (action) {
        case GateAction::OpenGate: return "abrir_cancela";
        case GateAction::Charge: return "cobrar_valor";
        case GateAction::DenyEntry: return "negar_entrada";
        case GateAction::DenyExit: return "negar_saida";
        case GateAction::Error: return "erro";
    }
    return "erro";
}

EventKind eventKindFromString(const std::string& value) {
    if (value == "entrada") return EventKind::Entry;
    if (value == "saida") return EventKind::Exit;
    if (value == "erro") return EventKind::Error;
    if (value == "manutencao") return EventKind::Maintenance;
    throw ProtocolError("unknown event type: " + value);
}

EventStatus eventStatusFromString(const std::string& value) {
    if (value == "pendente") return EventStatus::Pending;
    if (value == "processando") return EventStatus::Processing;
    if (value == "concluido") return EventStatus::Completed;
    if (value == "erro") return EventStatus::Error;
    throw ProtocolError("unknown event status: " + value);
}

GateAction gateActionFromString(const std::string& value) {
    if (value == "abrir_cancela") return GateAction::OpenGate;
    if (value == "cobrar_valor") return GateAction::Charge;
    if (value == "negar_entrada") return GateAction::DenyEntry;
    if (value == "negar_saida") return GateAction::DenyExit;
    if (value == "erro") return GateAction::Error;
    throw ProtocolError("unknown action: " + value);
}

bool isDenial(GateAction action) {
    return action == GateAction::DenyEntry || action == GateAction::DenyExit;
}
