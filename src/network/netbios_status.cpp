#include "network/netbios_status.hpp"

#include <QRegularExpression>
#include <QString>

namespace lantern::network {

std::optional<std::string> parse_nmblookup_status(std::string_view output) {
    static const QRegularExpression kNameLine(QStringLiteral(R"(^\s+([A-Za-z0-9_\-]+)\s+)"));

    const auto text = QString::fromUtf8(output.data(), static_cast<qsizetype>(output.size()));
    for (const auto& line : text.split(QLatin1Char('\n'))) {
        if (!line.contains(QStringLiteral("<00>"))) continue;
        if (line.contains(QStringLiteral("<GROUP>"))) continue;

        const auto match = kNameLine.match(line);
        if (match.hasMatch()) {
            return match.captured(1).toStdString();
        }
    }
    return std::nullopt;
}

} // namespace lantern::network
