#include "io/name_matching.hpp"

#include <QString>

namespace listall {
namespace {

QString trimmed_name(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size())).trimmed();
}

} // namespace

bool names_match(std::string_view a, std::string_view b) {
    return trimmed_name(a).compare(trimmed_name(b), Qt::CaseInsensitive) == 0;
}

} // namespace listall
