#include "sync/model/Records.hpp"

namespace sw::sync::model {

std::string to_string(const ActionKind k) {
    switch (k) {
        case ActionKind::Create: return "Create";
        case ActionKind::Update: return "Update";
        case ActionKind::Delete: return "Delete";
        case ActionKind::Skip: return "Skip";
    }
    return "Unknown";
}

}
