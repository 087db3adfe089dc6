#include "pulsescope/edge_mode.h"

#include "pulsescope/errors.h"

namespace pulsescope {

namespace {

QString normalized(const QString& name) {
    QString n = name.trimmed().toLower();
    n.replace(QLatin1Char('-'), QLatin1Char(' '));
    n.replace(QLatin1Char('_'), QLatin1Char(' '));
    return n.simplified();
}

} // namespace

QString channelName(Channel c) {
    return QStringLiteral("ID%1").arg(channelNumber(c) + 1);
}

Channel parseChannel(const QString& name) {
    const QString n = name.trimmed().toUpper();
    for (Channel c : ALL_CHANNELS) {
        if (n == channelName(c)) {
            return c;
        }
    }
    throw InvalidArgument("unknown channel '" + name.toStdString() + "', expected ID1..ID4");
}

EdgeModeCode encode(EdgeMode mode) {
    switch (mode) {
    case EdgeMode::Any: {
        return {1, 1};
    }
    case EdgeMode::Falling: {
        return {2, 1};
    }
    case EdgeMode::Rising: {
        return {3, 1};
    }
    case EdgeMode::FourRising: {
        return {4, 4};
    }
    case EdgeMode::SixteenRising: {
        return {5, 16};
    }
    }
    throw InvalidArgument("unknown edge mode " + std::to_string(int(mode)));
}

EdgeMode parseEdgeMode(const QString& name) {
    const QString n = normalized(name);
    if (n == QLatin1String("any")) {
        return EdgeMode::Any;
    }
    if (n == QLatin1String("rising")) {
        return EdgeMode::Rising;
    }
    if (n == QLatin1String("falling")) {
        return EdgeMode::Falling;
    }
    if (n == QLatin1String("four rising")) {
        return EdgeMode::FourRising;
    }
    if (n == QLatin1String("sixteen rising")) {
        return EdgeMode::SixteenRising;
    }
    throw InvalidArgument("unknown edge mode '" + name.toStdString() + "'");
}

QString edgeModeName(EdgeMode mode) {
    switch (mode) {
    case EdgeMode::Any: {
        return QStringLiteral("any");
    }
    case EdgeMode::Rising: {
        return QStringLiteral("rising");
    }
    case EdgeMode::Falling: {
        return QStringLiteral("falling");
    }
    case EdgeMode::FourRising: {
        return QStringLiteral("four rising");
    }
    case EdgeMode::SixteenRising: {
        return QStringLiteral("sixteen rising");
    }
    }
    throw InvalidArgument("unknown edge mode " + std::to_string(int(mode)));
}

TriggerDirection parseTriggerDirection(const QString& name) {
    const QString n = normalized(name);
    if (n == QLatin1String("disabled") || n == QLatin1String("none")) {
        return TriggerDirection::Disabled;
    }
    if (n == QLatin1String("rising")) {
        return TriggerDirection::Rising;
    }
    if (n == QLatin1String("falling")) {
        return TriggerDirection::Falling;
    }
    throw InvalidArgument("unknown trigger direction '" + name.toStdString() + "'");
}

QString triggerDirectionName(TriggerDirection direction) {
    switch (direction) {
    case TriggerDirection::Disabled: {
        return QStringLiteral("disabled");
    }
    case TriggerDirection::Rising: {
        return QStringLiteral("rising");
    }
    case TriggerDirection::Falling: {
        return QStringLiteral("falling");
    }
    }
    throw InvalidArgument("unknown trigger direction " + std::to_string(int(direction)));
}

quint8 encodeTrigger(const TriggerConfig& trigger, Layout layout) {
    if (trigger.direction == TriggerDirection::Disabled) {
        return 0;
    }
    const bool rising = trigger.direction == TriggerDirection::Rising;
    const quint8 n = channelNumber(trigger.channel);
    switch (layout) {
    case Layout::OneChannel: {
        return quint8((n << 4) | (rising ? 3 : 2));
    }
    case Layout::TwoChannel: {
        return quint8((n << 4) | (rising ? 1 : 3));
    }
    case Layout::FourChannel: {
        if (trigger.channel == Channel::ID4) {
            throw InvalidArgument("four channel captures can only trigger on ID1, ID2 or ID3");
        }
        return quint8((4 << n) | (rising ? 3 : 1));
    }
    }
    throw InvalidArgument("unknown capture layout");
}

} // namespace pulsescope
