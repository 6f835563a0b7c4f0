#include "messages.hpp"

namespace pgcdc::wire {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

char MessageType(const Message& message) {
  return std::visit(Overloaded{
                        [](const RelationMessage&) { return 'R'; },
                        [](const InsertMessage&) { return 'I'; },
                        [](const UpdateMessage&) { return 'U'; },
                        [](const DeleteMessage&) { return 'D'; },
                        [](const OtherMessage& m) { return m.type; },
                    },
                    message);
}

const char* MessageTypeName(char type) {
  switch (type) {
    case 'B': return "Begin";
    case 'C': return "Commit";
    case 'O': return "Origin";
    case 'R': return "Relation";
    case 'Y': return "Type";
    case 'I': return "Insert";
    case 'U': return "Update";
    case 'D': return "Delete";
    case 'T': return "Truncate";
    case 'M': return "Message";
    case 'S': return "StreamStart";
    case 'E': return "StreamStop";
    case 'c': return "StreamCommit";
    case 'A': return "StreamAbort";
    default: return "Unknown";
  }
}

} // namespace pgcdc::wire
