#include <unity.h>
#include <string.h>

#include "Modules/SchedulerModule/ScheduleCodec.h"

void setUp() {}
void tearDown() {}

static ScheduleCommand cmd;

static ErrorCode decodeV2(const char* json)
{
    cmd = ScheduleCommand{};
    return decodeScheduleCommand(json, strlen(json), ScheduleProtocol::Incremental, cmd);
}

static ErrorCode decodeV1(const char* json)
{
    cmd = ScheduleCommand{};
    return decodeScheduleCommand(json, strlen(json), ScheduleProtocol::Legacy, cmd);
}

void test_time_sync()
{
    TEST_ASSERT_EQUAL(ErrorCode::Ok, decodeV2("{\"cmd\":\"time_sync\",\"time\":1700000000}"));
    TEST_ASSERT_EQUAL(ScheduleCmdType::TimeSync, cmd.type);
    TEST_ASSERT_TRUE(cmd.hasTime);
    TEST_ASSERT_EQUAL_UINT32(1700000000UL, (uint32_t)cmd.epochSec);
}

void test_time_sync_rejects_bad_time()
{
    TEST_ASSERT_EQUAL(ErrorCode::MissingField, decodeV2("{\"cmd\":\"time_sync\"}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidTime, decodeV2("{\"cmd\":\"time_sync\",\"time\":\"now\"}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidTime, decodeV2("{\"cmd\":\"time_sync\",\"time\":-5}"));
}

void test_get_schedules()
{
    TEST_ASSERT_EQUAL(ErrorCode::Ok, decodeV2("{\"cmd\":\"get_schedules\"}"));
    TEST_ASSERT_EQUAL(ScheduleCmdType::GetSchedules, cmd.type);
}

void test_add_with_all_fields()
{
    const char* json =
        "{\"cmd\":\"add\",\"task\":{\"id\":\"3f1c2a9e-0b7d-4c55-9d1e-8a2b6c4d0e11\","
        "\"title\":\"Garden\",\"port\":5,\"start\":\"06:30\",\"end\":\"7:15\","
        "\"active\":false,\"alwaysOn\":true}}";
    TEST_ASSERT_EQUAL(ErrorCode::Ok, decodeV2(json));
    TEST_ASSERT_EQUAL(ScheduleCmdType::Add, cmd.type);
    TEST_ASSERT_EQUAL_STRING("3f1c2a9e-0b7d-4c55-9d1e-8a2b6c4d0e11", cmd.task.id);
    TEST_ASSERT_EQUAL_STRING("Garden", cmd.task.title);
    TEST_ASSERT_EQUAL_UINT8(5, cmd.task.port);
    TEST_ASSERT_EQUAL_UINT16(390, cmd.task.startMin);
    TEST_ASSERT_EQUAL_UINT16(435, cmd.task.endMin);
    TEST_ASSERT_FALSE(cmd.task.active);
    TEST_ASSERT_TRUE(cmd.task.alwaysOn);
    TEST_ASSERT_FALSE(cmd.titleTruncated);
}

void test_add_applies_defaults()
{
    TEST_ASSERT_EQUAL(ErrorCode::Ok,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"id\":\"a\",\"port\":2,\"start\":\"22:00\",\"end\":\"06:00\"}}"));
    TEST_ASSERT_EQUAL_STRING("", cmd.task.title);
    TEST_ASSERT_TRUE(cmd.task.active);
    TEST_ASSERT_FALSE(cmd.task.alwaysOn);
}

void test_add_flags_truncated_title()
{
    TEST_ASSERT_EQUAL(ErrorCode::Ok,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"id\":\"a\",\"title\":\"This title is definitely longer than thirty-one\","
                 "\"port\":2,\"start\":\"01:00\",\"end\":\"02:00\"}}"));
    TEST_ASSERT_TRUE(cmd.titleTruncated);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)(Limits::Sched::TitleLen - 1), (uint32_t)strlen(cmd.task.title));
}

void test_add_field_errors()
{
    TEST_ASSERT_EQUAL(ErrorCode::MissingField, decodeV2("{\"cmd\":\"add\"}"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingField,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"port\":2,\"start\":\"01:00\",\"end\":\"02:00\"}}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidId,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"id\":\"\",\"port\":2,\"start\":\"01:00\",\"end\":\"02:00\"}}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidPort,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"id\":\"a\",\"port\":49,\"start\":\"01:00\",\"end\":\"02:00\"}}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidPort,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"id\":\"a\",\"port\":\"2\",\"start\":\"01:00\",\"end\":\"02:00\"}}"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingField,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"id\":\"a\",\"port\":2,\"end\":\"02:00\"}}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidTime,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"id\":\"a\",\"port\":2,\"start\":\"25:00\",\"end\":\"02:00\"}}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidTask,
        decodeV2("{\"cmd\":\"add\",\"task\":{\"id\":\"a\",\"port\":2,\"start\":\"01:00\",\"end\":\"02:00\",\"active\":1}}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidTask, decodeV2("{\"cmd\":\"add\",\"task\":[1,2]}"));
}

void test_update_and_delete()
{
    TEST_ASSERT_EQUAL(ErrorCode::Ok,
        decodeV2("{\"cmd\":\"update\",\"task\":{\"id\":\"a\",\"port\":3,\"start\":\"01:00\",\"end\":\"02:00\"}}"));
    TEST_ASSERT_EQUAL(ScheduleCmdType::Update, cmd.type);
    TEST_ASSERT_EQUAL_STRING("a", cmd.task.id);

    TEST_ASSERT_EQUAL(ErrorCode::Ok, decodeV2("{\"cmd\":\"delete\",\"id\":\"a\"}"));
    TEST_ASSERT_EQUAL(ScheduleCmdType::Delete, cmd.type);
    TEST_ASSERT_EQUAL_STRING("a", cmd.id);

    TEST_ASSERT_EQUAL(ErrorCode::MissingField, decodeV2("{\"cmd\":\"delete\"}"));
    TEST_ASSERT_EQUAL(ErrorCode::InvalidId, decodeV2("{\"cmd\":\"delete\",\"id\":7}"));
}

void test_set_config_reserializes_patch()
{
    TEST_ASSERT_EQUAL(ErrorCode::Ok,
        decodeV2("{\"cmd\":\"set_config\",\"patch\":{\"sched\":{\"eval_ms\":500}}}"));
    TEST_ASSERT_EQUAL(ScheduleCmdType::SetConfig, cmd.type);
    TEST_ASSERT_EQUAL_STRING("{\"sched\":{\"eval_ms\":500}}", cmd.configPatch);

    TEST_ASSERT_EQUAL(ErrorCode::InvalidTask, decodeV2("{\"cmd\":\"set_config\",\"patch\":3}"));
}

void test_envelope_errors()
{
    TEST_ASSERT_EQUAL(ErrorCode::BadJson, decodeV2("{\"cmd\":"));
    TEST_ASSERT_EQUAL(ErrorCode::BadJson, decodeV2("[1,2,3]"));
    TEST_ASSERT_EQUAL(ErrorCode::BadJson, decodeV2("42"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingCmd, decodeV2("{\"time\":1700000000}"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingCmd, decodeV2("{\"cmd\":\"\"}"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingCmd, decodeV2("{\"cmd\":5}"));
    TEST_ASSERT_EQUAL(ErrorCode::UnknownCmd, decodeV2("{\"cmd\":\"reboot\"}"));
    TEST_ASSERT_EQUAL(ErrorCode::UnknownCmd, decodeV2("{\"cmd\":\"set_schedules\",\"data\":[]}"));
    TEST_ASSERT_EQUAL(ErrorCode::BadJson,
        decodeScheduleCommand("{}", 0, ScheduleProtocol::Incremental, cmd));
}

void test_oversize_payload_is_rejected()
{
    static char big[Limits::Ble::RxPayload + 8];
    memset(big, ' ', sizeof(big));
    memcpy(big, "{\"cmd\":\"get_schedules\"}", 23);
    big[sizeof(big) - 1] = '\0';
    TEST_ASSERT_EQUAL(ErrorCode::PayloadTooLarge, decodeV2(big));
}

void test_legacy_bare_time_is_a_time_sync()
{
    TEST_ASSERT_EQUAL(ErrorCode::Ok, decodeV1("{\"time\":1700000000}"));
    TEST_ASSERT_EQUAL(ScheduleCmdType::TimeSync, cmd.type);
    TEST_ASSERT_TRUE(cmd.hasTime);
    TEST_ASSERT_EQUAL(ErrorCode::MissingCmd, decodeV1("{\"hello\":1}"));
}

void test_legacy_set_schedules_with_time()
{
    const char* json =
        "{\"cmd\":\"set_schedules\",\"time\":1700000000,\"data\":["
        "{\"port\":2,\"active\":true,\"start\":\"08:00\",\"end\":\"09:00\"},"
        "{\"port\":4,\"active\":false,\"start\":\"21:00\",\"end\":\"05:00\"}]}";
    TEST_ASSERT_EQUAL(ErrorCode::Ok, decodeV1(json));
    TEST_ASSERT_EQUAL(ScheduleCmdType::SetSchedules, cmd.type);
    TEST_ASSERT_TRUE(cmd.hasTime);
    TEST_ASSERT_EQUAL_UINT8(2, cmd.taskCount);
    TEST_ASSERT_EQUAL_UINT8(0, cmd.tasksSkipped);
    TEST_ASSERT_EQUAL_STRING("legacy-0", cmd.tasks[0].id);
    TEST_ASSERT_EQUAL_STRING("legacy-1", cmd.tasks[1].id);
    TEST_ASSERT_EQUAL_STRING("", cmd.tasks[1].title);
    TEST_ASSERT_EQUAL_UINT8(4, cmd.tasks[1].port);
    TEST_ASSERT_FALSE(cmd.tasks[1].active);
    TEST_ASSERT_FALSE(cmd.tasks[1].alwaysOn);
    TEST_ASSERT_EQUAL_UINT16(1260, cmd.tasks[1].startMin);
}

void test_legacy_rejects_incremental_commands()
{
    TEST_ASSERT_EQUAL(ErrorCode::UnknownCmd,
        decodeV1("{\"cmd\":\"add\",\"task\":{\"id\":\"a\",\"port\":2,\"start\":\"01:00\",\"end\":\"02:00\"}}"));
    TEST_ASSERT_EQUAL(ErrorCode::Ok, decodeV1("{\"cmd\":\"get_schedules\"}"));
    TEST_ASSERT_EQUAL(ErrorCode::MissingField, decodeV1("{\"cmd\":\"set_schedules\"}"));
}

void test_snapshot_field_set_and_order()
{
    TaskTable table;
    ScheduleTask t{};
    scheduleTaskSetId(t, "a");
    scheduleTaskSetTitle(t, "Pump");
    t.port = 2;
    t.startMin = 8 * 60;
    t.endMin = 17 * 60 + 30;
    table.add(t);

    ScheduleTask u{};
    scheduleTaskSetId(u, "b");
    u.port = 14;
    u.startMin = 0;
    u.endMin = 5;
    u.active = false;
    u.alwaysOn = true;
    table.add(u);

    char out[512];
    const size_t n = encodeScheduleSnapshot(table, out, sizeof(out));
    TEST_ASSERT_EQUAL_STRING(
        "[{\"id\":\"a\",\"title\":\"Pump\",\"port\":2,\"start\":\"08:00\",\"end\":\"17:30\","
        "\"active\":true,\"alwaysOn\":false},"
        "{\"id\":\"b\",\"title\":\"\",\"port\":14,\"start\":\"00:00\",\"end\":\"00:05\","
        "\"active\":false,\"alwaysOn\":true}]",
        out);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)strlen(out), (uint32_t)n);
    TEST_ASSERT_TRUE(isCompleteSnapshot(out, n));
}

void test_snapshot_of_empty_table()
{
    TaskTable table;
    char out[8];
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)encodeScheduleSnapshot(table, out, sizeof(out)));
    TEST_ASSERT_EQUAL_STRING("[]", out);
}

void test_snapshot_overflow_returns_zero()
{
    TaskTable table;
    ScheduleTask t{};
    scheduleTaskSetId(t, "a-rather-long-identifier");
    table.add(t);
    char out[16];
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)encodeScheduleSnapshot(table, out, sizeof(out)));
}

void test_snapshot_of_full_table_with_escaped_text_fits()
{
    char id[Limits::Sched::IdLen];
    char title[Limits::Sched::TitleLen];
    TaskTable table;
    for (uint8_t i = 0; i < Limits::Sched::MaxTasks; ++i) {
        // Distinct ids made only of characters that escape to two bytes.
        memset(id, '"', sizeof(id) - 1);
        id[sizeof(id) - 1] = '\0';
        for (uint8_t b = 0; b < 5; ++b) {
            if (i & (1u << b)) id[b] = '\\';
        }
        memset(title, '"', sizeof(title) - 1);
        title[sizeof(title) - 1] = '\0';

        ScheduleTask t{};
        TEST_ASSERT_TRUE(scheduleTaskSetId(t, id));
        scheduleTaskSetTitle(t, title);
        t.port = Limits::Sched::MaxPort;
        t.startMin = 23 * 60 + 59;
        t.endMin = 23 * 60 + 59;
        t.active = false;
        TEST_ASSERT_EQUAL(ErrorCode::Ok, table.add(t));
    }

    static char out[Limits::Sched::SnapshotBuf];
    const size_t n = encodeScheduleSnapshot(table, out, sizeof(out));
    // Worst case minus the null and the comma the last record does not have.
    TEST_ASSERT_EQUAL_UINT32((uint32_t)(Limits::Sched::SnapshotBuf - 2), (uint32_t)n);
    TEST_ASSERT_TRUE(isCompleteSnapshot(out, n));
}

void test_complete_snapshot_check()
{
    TEST_ASSERT_TRUE(isCompleteSnapshot("  [ ]\n", 6));
    TEST_ASSERT_TRUE(isCompleteSnapshot("[]", 2));
    TEST_ASSERT_FALSE(isCompleteSnapshot("[{\"id\":\"a\"", 10));
    TEST_ASSERT_FALSE(isCompleteSnapshot("{}", 2));
    TEST_ASSERT_FALSE(isCompleteSnapshot("[", 1));
    TEST_ASSERT_FALSE(isCompleteSnapshot(nullptr, 0));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_time_sync);
    RUN_TEST(test_time_sync_rejects_bad_time);
    RUN_TEST(test_get_schedules);
    RUN_TEST(test_add_with_all_fields);
    RUN_TEST(test_add_applies_defaults);
    RUN_TEST(test_add_flags_truncated_title);
    RUN_TEST(test_add_field_errors);
    RUN_TEST(test_update_and_delete);
    RUN_TEST(test_set_config_reserializes_patch);
    RUN_TEST(test_envelope_errors);
    RUN_TEST(test_oversize_payload_is_rejected);
    RUN_TEST(test_legacy_bare_time_is_a_time_sync);
    RUN_TEST(test_legacy_set_schedules_with_time);
    RUN_TEST(test_legacy_rejects_incremental_commands);
    RUN_TEST(test_snapshot_field_set_and_order);
    RUN_TEST(test_snapshot_of_empty_table);
    RUN_TEST(test_snapshot_overflow_returns_zero);
    RUN_TEST(test_snapshot_of_full_table_with_escaped_text_fits);
    RUN_TEST(test_complete_snapshot_check);
    return UNITY_END();
}
