/**
 * @file TaskRecordStore.cpp
 * @brief Implementation file.
 */

#include "Modules/SchedulerModule/TaskRecordStore.h"
#include "Core/NvsKeys.h"
#include <stdio.h>
#include <string.h>

namespace {
constexpr size_t kIdOff = 0;
constexpr size_t kTitleOff = kIdOff + Limits::Sched::IdLen;
constexpr size_t kPortOff = kTitleOff + Limits::Sched::TitleLen;
constexpr size_t kStartOff = kPortOff + 1;
constexpr size_t kEndOff = kStartOff + 2;
constexpr size_t kFlagsOff = kEndOff + 2;

constexpr uint8_t kFlagActive = 0x01;
constexpr uint8_t kFlagAlwaysOn = 0x02;
constexpr uint8_t kFlagsKnown = kFlagActive | kFlagAlwaysOn;

void putU16Le(uint8_t* p, uint16_t v)
{
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)(v >> 8);
}

uint16_t getU16Le(const uint8_t* p)
{
    return (uint16_t)(p[0] | ((uint16_t)p[1] << 8));
}
}  // namespace

static_assert(kFlagsOff + 1 == TaskRecordStore::RecordLen, "record layout mismatch");

void TaskRecordStore::recordKey_(uint8_t index, char* out, size_t outLen)
{
    snprintf(out, outLen, "%s%02u", NvsKeys::TaskStore::RecordPrefix, (unsigned)index);
}

void TaskRecordStore::encodeRecord(const ScheduleTask& t, uint8_t (&rec)[RecordLen])
{
    memset(rec, 0, sizeof(rec));
    strncpy((char*)rec + kIdOff, t.id, Limits::Sched::IdLen - 1);
    strncpy((char*)rec + kTitleOff, t.title, Limits::Sched::TitleLen - 1);
    rec[kPortOff] = t.port;
    putU16Le(rec + kStartOff, t.startMin);
    putU16Le(rec + kEndOff, t.endMin);
    rec[kFlagsOff] = (uint8_t)((t.active ? kFlagActive : 0) | (t.alwaysOn ? kFlagAlwaysOn : 0));
}

bool TaskRecordStore::decodeRecord(const uint8_t (&rec)[RecordLen], ScheduleTask& t)
{
    // Both strings must be terminated inside their field.
    if (rec[kTitleOff - 1] != 0 || rec[kPortOff - 1] != 0) return false;
    if ((rec[kFlagsOff] & ~kFlagsKnown) != 0) return false;

    t = ScheduleTask{};
    memcpy(t.id, rec + kIdOff, Limits::Sched::IdLen);
    memcpy(t.title, rec + kTitleOff, Limits::Sched::TitleLen);
    t.port = rec[kPortOff];
    t.startMin = getU16Le(rec + kStartOff);
    t.endMin = getU16Le(rec + kEndOff);
    t.active = (rec[kFlagsOff] & kFlagActive) != 0;
    t.alwaysOn = (rec[kFlagsOff] & kFlagAlwaysOn) != 0;
    return scheduleTaskIsValid(t);
}

ErrorCode TaskRecordStore::save(const TaskTable& table)
{
    staleFailures_ = 0;
    if (!store_.isOpen()) return ErrorCode::StorageUnavailable;

    if (!store_.putU8(NvsKeys::TaskStore::Version, LayoutVersion)) return ErrorCode::StorageWriteFailed;
    if (!store_.putU8(NvsKeys::TaskStore::Count, table.size())) return ErrorCode::StorageWriteFailed;

    char key[8];
    uint8_t rec[RecordLen];
    for (uint8_t i = 0; i < table.size(); ++i) {
        encodeRecord(table.at(i), rec);
        recordKey_(i, key, sizeof(key));
        if (!store_.putBytes(key, rec, sizeof(rec))) return ErrorCode::StorageWriteFailed;
    }

    // The count is authoritative; leftovers past it are only reclaimed space.
    for (uint8_t i = table.size(); i < TaskTable::Capacity; ++i) {
        recordKey_(i, key, sizeof(key));
        if (!store_.remove(key)) ++staleFailures_;
    }
    return ErrorCode::Ok;
}

ErrorCode TaskRecordStore::load(TaskTable& out)
{
    out.clear();
    if (!store_.isOpen()) return ErrorCode::StorageUnavailable;

    uint8_t count = 0;
    if (!store_.getU8(NvsKeys::TaskStore::Count, count)) return ErrorCode::StorageEmpty;

    uint8_t version = 0;
    if (!store_.getU8(NvsKeys::TaskStore::Version, version) || version != LayoutVersion) {
        return ErrorCode::StorageCorrupt;
    }
    if (count > TaskTable::Capacity) return ErrorCode::StorageCorrupt;

    char key[8];
    uint8_t rec[RecordLen];
    for (uint8_t i = 0; i < count; ++i) {
        recordKey_(i, key, sizeof(key));
        if (store_.bytesLength(key) != RecordLen ||
            store_.getBytes(key, rec, sizeof(rec)) != RecordLen) {
            out.clear();
            return ErrorCode::StorageCorrupt;
        }
        ScheduleTask t{};
        if (!decodeRecord(rec, t) || out.add(t) != ErrorCode::Ok) {
            out.clear();
            return ErrorCode::StorageCorrupt;
        }
    }
    return ErrorCode::Ok;
}
