#include <unity.h>

#include "FakeOutputBank.h"
#include "Modules/SchedulerModule/ScheduleEvaluator.h"
#include "Modules/SchedulerModule/SchedulePass.h"

void setUp() {}
void tearDown() {}

static ScheduleTask makeTask(const char* id, uint8_t port, uint16_t start, uint16_t end)
{
    ScheduleTask t{};
    scheduleTaskSetId(t, id);
    t.port = port;
    t.startMin = start;
    t.endMin = end;
    return t;
}

void test_first_pass_writes_every_referenced_port()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("on", 2, 0, 600));
    table.add(makeTask("off", 4, 700, 800));

    ScheduleTickResult r = eval.tick(table, 300);
    TEST_ASSERT_EQUAL_UINT8(2, r.writes);
    TEST_ASSERT_EQUAL_UINT8(0, r.failures);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[2]);
    TEST_ASSERT_EQUAL_INT8(0, bank.level[4]);
    TEST_ASSERT_EQUAL_INT8(1, eval.lastWritten(2));
    TEST_ASSERT_EQUAL_INT8(0, eval.lastWritten(4));
    TEST_ASSERT_EQUAL_INT8(-1, eval.lastWritten(5));
}

void test_unchanged_state_is_not_rewritten()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("a", 2, 0, 600));

    eval.tick(table, 10);
    bank.resetCounters();
    for (uint16_t m = 11; m < 600; m += 50) {
        ScheduleTickResult r = eval.tick(table, m);
        TEST_ASSERT_EQUAL_UINT8(0, r.writes);
    }
    TEST_ASSERT_EQUAL_UINT16(0, bank.writeCount);
}

void test_window_edge_triggers_exactly_one_write()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("a", 2, 100, 200));

    eval.tick(table, 99);
    TEST_ASSERT_EQUAL_INT8(0, bank.level[2]);

    bank.resetCounters();
    eval.tick(table, 100);
    eval.tick(table, 101);
    TEST_ASSERT_EQUAL_UINT16(1, bank.writesPerPort[2]);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[2]);

    eval.tick(table, 200);
    TEST_ASSERT_EQUAL_UINT16(2, bank.writesPerPort[2]);
    TEST_ASSERT_EQUAL_INT8(0, bank.level[2]);
}

void test_shared_port_is_on_when_any_task_wants_it()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("morning", 3, 360, 480));
    table.add(makeTask("evening", 3, 1080, 1200));

    eval.tick(table, 400);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[3]);
    eval.tick(table, 600);
    TEST_ASSERT_EQUAL_INT8(0, bank.level[3]);
    eval.tick(table, 1100);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[3]);

    // Order of the tasks does not matter.
    TaskTable swapped;
    swapped.add(makeTask("evening", 3, 1080, 1200));
    swapped.add(makeTask("morning", 3, 360, 480));
    FakeOutputBank bank2;
    ScheduleEvaluator eval2(bank2);
    eval2.tick(swapped, 400);
    TEST_ASSERT_EQUAL_INT8(1, bank2.level[3]);
}

void test_removed_task_port_is_released_once()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("a", 5, 0, 1000));
    eval.tick(table, 10);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[5]);

    table.remove("a");
    ScheduleTickResult r = eval.tick(table, 11);
    TEST_ASSERT_EQUAL_UINT8(1, r.released);
    TEST_ASSERT_EQUAL_INT8(0, bank.level[5]);
    TEST_ASSERT_EQUAL_INT8(-1, eval.lastWritten(5));

    bank.resetCounters();
    r = eval.tick(table, 12);
    TEST_ASSERT_EQUAL_UINT8(0, r.released);
    TEST_ASSERT_EQUAL_UINT16(0, bank.writeCount);
}

void test_released_port_that_was_off_is_left_alone()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("a", 5, 500, 600));
    eval.tick(table, 10);
    TEST_ASSERT_EQUAL_INT8(0, bank.level[5]);

    table.remove("a");
    bank.resetCounters();
    ScheduleTickResult r = eval.tick(table, 11);
    TEST_ASSERT_EQUAL_UINT8(0, r.released);
    TEST_ASSERT_EQUAL_UINT16(0, bank.writeCount);
}

void test_refused_write_is_counted_and_not_retried()
{
    FakeOutputBank bank;
    bank.refused[7] = true;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("dead", 7, 0, 1000));
    table.add(makeTask("ok", 8, 0, 1000));

    ScheduleTickResult r = eval.tick(table, 1);
    TEST_ASSERT_EQUAL_UINT8(2, r.writes);
    TEST_ASSERT_EQUAL_UINT8(1, r.failures);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[8]);

    bank.resetCounters();
    r = eval.tick(table, 2);
    TEST_ASSERT_EQUAL_UINT8(0, r.writes);
    TEST_ASSERT_EQUAL_UINT8(0, r.failures);
    TEST_ASSERT_EQUAL_UINT16(0, bank.writeCount);
}

void test_forget_forces_a_full_rewrite()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("a", 2, 0, 1000));
    table.add(makeTask("b", 4, 0, 10));
    eval.tick(table, 500);

    eval.forget();
    bank.resetCounters();
    ScheduleTickResult r = eval.tick(table, 500);
    TEST_ASSERT_EQUAL_UINT8(2, r.writes);
    TEST_ASSERT_EQUAL_UINT16(2, bank.writeCount);
}

void test_disabled_task_drives_port_off()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    ScheduleTask t = makeTask("a", 2, 0, 1000);
    table.add(t);
    eval.tick(table, 5);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[2]);

    t.active = false;
    table.update(t);
    eval.tick(table, 6);
    TEST_ASSERT_EQUAL_INT8(0, bank.level[2]);
}

void test_output_revision_change_rewrites_every_port()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TaskTable table;
    table.add(makeTask("a", 2, 0, 1000));
    table.add(makeTask("b", 4, 0, 10));
    eval.tick(table, 500);

    bank.resetCounters();
    TEST_ASSERT_EQUAL_UINT8(0, eval.tick(table, 501).writes);

    // Polarity flipped on the bank: levels already on the pins are now inverted.
    ++bank.revision;
    ScheduleTickResult r = eval.tick(table, 502);
    TEST_ASSERT_EQUAL_UINT8(2, r.writes);
    TEST_ASSERT_EQUAL_UINT16(1, bank.writesPerPort[2]);
    TEST_ASSERT_EQUAL_UINT16(1, bank.writesPerPort[4]);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[2]);

    bank.resetCounters();
    TEST_ASSERT_EQUAL_UINT8(0, eval.tick(table, 503).writes);
}

void test_unbound_evaluator_writes_nothing()
{
    ScheduleEvaluator eval;
    TaskTable table;
    table.add(makeTask("a", 2, 0, 1000));
    TEST_ASSERT_FALSE(eval.isBound());
    TEST_ASSERT_EQUAL_UINT8(0, eval.tick(table, 500).writes);

    FakeOutputBank bank;
    eval.bind(bank);
    TEST_ASSERT_EQUAL_UINT8(1, eval.tick(table, 500).writes);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[2]);
}

void test_pass_holds_outputs_until_time_sync()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TransportSession session;
    TaskTable table;
    table.add(makeTask("a", 2, 600, 700));

    TEST_ASSERT_FALSE(runSchedulePass(eval, table, session, true, 650).ran);
    session.onConnected();
    TEST_ASSERT_FALSE(runSchedulePass(eval, table, session, true, 650).ran);
    TEST_ASSERT_EQUAL_UINT16(0, bank.writeCount);

    session.onTimeSync();
    SchedulePassResult p = runSchedulePass(eval, table, session, true, 650);
    TEST_ASSERT_TRUE(p.ran);
    TEST_ASSERT_EQUAL_UINT8(1, p.tick.writes);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[2]);

    TEST_ASSERT_FALSE(runSchedulePass(eval, table, session, false, 650).ran);
}

void test_reconnect_holds_outputs_until_next_time_sync()
{
    FakeOutputBank bank;
    ScheduleEvaluator eval(bank);
    TransportSession session;
    TaskTable table;
    table.add(makeTask("a", 2, 600, 700));

    session.onConnected();
    session.onTimeSync();
    TEST_ASSERT_TRUE(runSchedulePass(eval, table, session, true, 650).ran);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[2]);

    session.onDisconnected();
    session.onConnected();
    bank.resetCounters();
    // The window has closed by the local clock, but the new connection has not synced yet.
    TEST_ASSERT_FALSE(runSchedulePass(eval, table, session, true, 720).ran);
    TEST_ASSERT_EQUAL_UINT16(0, bank.writeCount);
    TEST_ASSERT_EQUAL_INT8(1, bank.level[2]);

    session.onTimeSync();
    SchedulePassResult p = runSchedulePass(eval, table, session, true, 720);
    TEST_ASSERT_TRUE(p.ran);
    TEST_ASSERT_EQUAL_UINT8(1, p.tick.writes);
    TEST_ASSERT_EQUAL_INT8(0, bank.level[2]);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_first_pass_writes_every_referenced_port);
    RUN_TEST(test_unchanged_state_is_not_rewritten);
    RUN_TEST(test_window_edge_triggers_exactly_one_write);
    RUN_TEST(test_shared_port_is_on_when_any_task_wants_it);
    RUN_TEST(test_removed_task_port_is_released_once);
    RUN_TEST(test_released_port_that_was_off_is_left_alone);
    RUN_TEST(test_refused_write_is_counted_and_not_retried);
    RUN_TEST(test_forget_forces_a_full_rewrite);
    RUN_TEST(test_disabled_task_drives_port_off);
    RUN_TEST(test_output_revision_change_rewrites_every_port);
    RUN_TEST(test_unbound_evaluator_writes_nothing);
    RUN_TEST(test_pass_holds_outputs_until_time_sync);
    RUN_TEST(test_reconnect_holds_outputs_until_next_time_sync);
    return UNITY_END();
}
