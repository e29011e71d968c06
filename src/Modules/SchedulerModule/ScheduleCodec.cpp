/**
 * @file ScheduleCodec.cpp
 * @brief Implementation file.
 */

#include "Modules/SchedulerModule/ScheduleCodec.h"
#include "Modules/SchedulerModule/ScheduleWindow.h"
#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>

namespace {

constexpr uint8_t kTaskFields = 7;
constexpr size_t kClockTextLen = 6;  // "HH:MM" + null

// Strings are copied out of the (const) input, so the input length bounds them.
constexpr size_t kCmdDocCapacity =
    JSON_OBJECT_SIZE(4) + JSON_ARRAY_SIZE(Limits::Sched::MaxTasks) +
    (Limits::Sched::MaxTasks + 1) * JSON_OBJECT_SIZE(kTaskFields) +
    Limits::Ble::RxPayload;

// Ids and titles are stored by pointer; only the clock strings are copied.
constexpr size_t kSnapshotDocCapacity =
    JSON_ARRAY_SIZE(Limits::Sched::MaxTasks) +
    Limits::Sched::MaxTasks * (JSON_OBJECT_SIZE(kTaskFields) + 2 * kClockTextLen);

bool cmdIs(const char* cmd, const char* name)
{
    return strcmp(cmd, name) == 0;
}

ErrorCode readTime(JsonObjectConst root, ScheduleCommand& out)
{
    JsonVariantConst v = root["time"];
    if (v.isNull()) return ErrorCode::MissingField;
    if (!v.is<long long>()) return ErrorCode::InvalidTime;
    const long long epoch = v.as<long long>();
    if (epoch < 0) return ErrorCode::InvalidTime;
    out.hasTime = true;
    out.epochSec = (uint64_t)epoch;
    return ErrorCode::Ok;
}

ErrorCode readClock(JsonObjectConst o, const char* key, uint16_t& outMin)
{
    JsonVariantConst v = o[key];
    if (v.isNull()) return ErrorCode::MissingField;
    if (!v.is<const char*>()) return ErrorCode::InvalidTime;
    if (!parseClockMinutes(v.as<const char*>(), outMin)) return ErrorCode::InvalidTime;
    return ErrorCode::Ok;
}

ErrorCode readPort(JsonObjectConst o, uint8_t& outPort)
{
    JsonVariantConst v = o["port"];
    if (v.isNull()) return ErrorCode::MissingField;
    if (!v.is<int>()) return ErrorCode::InvalidPort;
    const int port = v.as<int>();
    if (port < 0 || port > Limits::Sched::MaxPort) return ErrorCode::InvalidPort;
    outPort = (uint8_t)port;
    return ErrorCode::Ok;
}

ErrorCode readOptionalBool(JsonObjectConst o, const char* key, bool& inOut)
{
    JsonVariantConst v = o[key];
    if (v.isNull()) return ErrorCode::Ok;
    if (!v.is<bool>()) return ErrorCode::InvalidTask;
    inOut = v.as<bool>();
    return ErrorCode::Ok;
}

ErrorCode readId(JsonVariantConst v, char* out, size_t outLen)
{
    if (v.isNull()) return ErrorCode::MissingField;
    if (!v.is<const char*>()) return ErrorCode::InvalidId;
    const char* s = v.as<const char*>();
    const size_t len = strlen(s);
    if (len == 0 || len >= outLen) return ErrorCode::InvalidId;
    memcpy(out, s, len + 1);
    return ErrorCode::Ok;
}

ErrorCode readTaskObject(JsonVariantConst v, ScheduleTask& t, bool& titleTruncated)
{
    if (v.isNull()) return ErrorCode::MissingField;
    if (!v.is<JsonObjectConst>()) return ErrorCode::InvalidTask;
    JsonObjectConst o = v.as<JsonObjectConst>();

    t = ScheduleTask{};
    ErrorCode err = readId(o["id"], t.id, sizeof(t.id));
    if (err != ErrorCode::Ok) return err;

    JsonVariantConst title = o["title"];
    if (!title.isNull()) {
        if (!title.is<const char*>()) return ErrorCode::InvalidTask;
        titleTruncated = scheduleTaskSetTitle(t, title.as<const char*>());
    }

    if ((err = readPort(o, t.port)) != ErrorCode::Ok) return err;
    if ((err = readClock(o, "start", t.startMin)) != ErrorCode::Ok) return err;
    if ((err = readClock(o, "end", t.endMin)) != ErrorCode::Ok) return err;
    if ((err = readOptionalBool(o, "active", t.active)) != ErrorCode::Ok) return err;
    if ((err = readOptionalBool(o, "alwaysOn", t.alwaysOn)) != ErrorCode::Ok) return err;
    return ErrorCode::Ok;
}

ErrorCode readLegacyRecords(JsonObjectConst root, ScheduleCommand& out)
{
    JsonVariantConst data = root["data"];
    if (data.isNull()) return ErrorCode::MissingField;
    if (!data.is<JsonArrayConst>()) return ErrorCode::InvalidTask;

    out.taskCount = 0;
    out.tasksSkipped = 0;
    uint16_t index = 0;
    for (JsonVariantConst item : data.as<JsonArrayConst>()) {
        if (!item.is<JsonObjectConst>()) return ErrorCode::InvalidTask;
        JsonObjectConst o = item.as<JsonObjectConst>();

        ScheduleTask t{};
        snprintf(t.id, sizeof(t.id), "legacy-%u", (unsigned)index);
        ErrorCode err = readPort(o, t.port);
        if (err != ErrorCode::Ok) return err;
        if ((err = readClock(o, "start", t.startMin)) != ErrorCode::Ok) return err;
        if ((err = readClock(o, "end", t.endMin)) != ErrorCode::Ok) return err;
        if ((err = readOptionalBool(o, "active", t.active)) != ErrorCode::Ok) return err;

        if (out.taskCount < Limits::Sched::MaxTasks) {
            out.tasks[out.taskCount++] = t;
        } else if (out.tasksSkipped < UINT8_MAX) {
            ++out.tasksSkipped;
        }
        ++index;
    }
    return ErrorCode::Ok;
}

ErrorCode readConfigPatch(JsonObjectConst root, ScheduleCommand& out)
{
    JsonVariantConst patch = root["patch"];
    if (patch.isNull()) return ErrorCode::MissingField;
    if (!patch.is<JsonObjectConst>()) return ErrorCode::InvalidTask;
    if (measureJson(patch) >= sizeof(out.configPatch)) return ErrorCode::PayloadTooLarge;
    serializeJson(patch, out.configPatch, sizeof(out.configPatch));
    return ErrorCode::Ok;
}

ErrorCode decodeIncremental(JsonObjectConst root, const char* cmd, ScheduleCommand& out)
{
    if (cmdIs(cmd, "time_sync")) {
        out.type = ScheduleCmdType::TimeSync;
        return readTime(root, out);
    }
    if (cmdIs(cmd, "get_schedules")) {
        out.type = ScheduleCmdType::GetSchedules;
        return ErrorCode::Ok;
    }
    if (cmdIs(cmd, "add")) {
        out.type = ScheduleCmdType::Add;
        return readTaskObject(root["task"], out.task, out.titleTruncated);
    }
    if (cmdIs(cmd, "update")) {
        out.type = ScheduleCmdType::Update;
        return readTaskObject(root["task"], out.task, out.titleTruncated);
    }
    if (cmdIs(cmd, "delete")) {
        out.type = ScheduleCmdType::Delete;
        return readId(root["id"], out.id, sizeof(out.id));
    }
    if (cmdIs(cmd, "set_config")) {
        out.type = ScheduleCmdType::SetConfig;
        return readConfigPatch(root, out);
    }
    return ErrorCode::UnknownCmd;
}

ErrorCode decodeLegacy(JsonObjectConst root, const char* cmd, ScheduleCommand& out)
{
    // `time` may ride along with any legacy message.
    if (!root["time"].isNull()) {
        const ErrorCode err = readTime(root, out);
        if (err != ErrorCode::Ok) return err;
    }

    if (!cmd) {
        if (!out.hasTime) return ErrorCode::MissingCmd;
        out.type = ScheduleCmdType::TimeSync;
        return ErrorCode::Ok;
    }
    if (cmdIs(cmd, "set_schedules")) {
        out.type = ScheduleCmdType::SetSchedules;
        return readLegacyRecords(root, out);
    }
    if (cmdIs(cmd, "get_schedules")) {
        out.type = ScheduleCmdType::GetSchedules;
        return ErrorCode::Ok;
    }
    if (cmdIs(cmd, "set_config")) {
        out.type = ScheduleCmdType::SetConfig;
        return readConfigPatch(root, out);
    }
    return ErrorCode::UnknownCmd;
}

}  // namespace

ErrorCode decodeScheduleCommand(const char* json, size_t len, ScheduleProtocol proto,
                                ScheduleCommand& out)
{
    if (!json || len == 0) return ErrorCode::BadJson;
    if (len >= Limits::Ble::RxPayload) return ErrorCode::PayloadTooLarge;

    static StaticJsonDocument<kCmdDocCapacity> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json, len);
    if (err || !doc.is<JsonObjectConst>()) return ErrorCode::BadJson;

    JsonObjectConst root = doc.as<JsonObjectConst>();
    out.hasTime = false;
    out.epochSec = 0;
    out.titleTruncated = false;

    const char* cmd = nullptr;
    JsonVariantConst cmdVar = root["cmd"];
    if (!cmdVar.isNull()) {
        if (!cmdVar.is<const char*>()) return ErrorCode::MissingCmd;
        cmd = cmdVar.as<const char*>();
        if (!cmd || cmd[0] == '\0') return ErrorCode::MissingCmd;
    }

    if (proto == ScheduleProtocol::Legacy) return decodeLegacy(root, cmd, out);
    if (!cmd) return ErrorCode::MissingCmd;
    return decodeIncremental(root, cmd, out);
}

size_t encodeScheduleSnapshot(const TaskTable& table, char* out, size_t outLen)
{
    if (!out || outLen < 3) return 0;

    static StaticJsonDocument<kSnapshotDocCapacity> doc;
    doc.clear();
    JsonArray arr = doc.to<JsonArray>();

    for (uint8_t i = 0; i < table.size(); ++i) {
        const ScheduleTask& t = table.at(i);
        JsonObject o = arr.createNestedObject();
        if (o.isNull()) return 0;

        char start[kClockTextLen];
        char end[kClockTextLen];
        if (!formatClockMinutes(t.startMin, start, sizeof(start))) return 0;
        if (!formatClockMinutes(t.endMin, end, sizeof(end))) return 0;

        o["id"] = (const char*)t.id;
        o["title"] = (const char*)t.title;
        o["port"] = t.port;
        o["start"] = start;   // char* is copied into the document
        o["end"] = end;
        o["active"] = t.active;
        o["alwaysOn"] = t.alwaysOn;
    }
    if (doc.overflowed()) return 0;

    const size_t need = measureJson(doc);
    if (need + 1 > outLen) return 0;
    return serializeJson(doc, out, outLen);
}

bool isCompleteSnapshot(const char* text, size_t len)
{
    if (!text) return false;
    size_t begin = 0;
    size_t end = len;
    while (begin < end && (text[begin] == ' ' || text[begin] == '\t' ||
                           text[begin] == '\r' || text[begin] == '\n')) {
        ++begin;
    }
    while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t' ||
                           text[end - 1] == '\r' || text[end - 1] == '\n' ||
                           text[end - 1] == '\0')) {
        --end;
    }
    if (end - begin < 2) return false;
    return text[begin] == '[' && text[end - 1] == ']';
}

const char* scheduleCmdName(ScheduleCmdType type)
{
    switch (type) {
    case ScheduleCmdType::TimeSync: return "time_sync";
    case ScheduleCmdType::GetSchedules: return "get_schedules";
    case ScheduleCmdType::Add: return "add";
    case ScheduleCmdType::Update: return "update";
    case ScheduleCmdType::Delete: return "delete";
    case ScheduleCmdType::SetSchedules: return "set_schedules";
    case ScheduleCmdType::SetConfig: return "set_config";
    default: return "?";
    }
}
