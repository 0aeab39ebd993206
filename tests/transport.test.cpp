#include <AbcPop/Channel.h>
#include <AbcPop/Codec.h>
#include <AbcPop/Errors.h>
#include <AbcPop/Process.h>
#include <cmath>
#include <csignal>
#include <limits>
#include <stdexcept>
#include <unistd.h>

#include "testing.h"

using namespace ABCPOP;
using namespace std;

void test_channel_in_process() {
    Channel ch;
    ch.put("first");
    ch.put("");
    ch.put("third");
    IS_TRUE(ch.poll(0));
    IS_TRUE(ch.get() == "first");
    IS_TRUE(ch.get() == "");
    IS_TRUE(ch.get() == "third");
    IS_TRUE(not ch.poll(0));
}

void test_channel_size_limit() {
    Channel ch;
    IS_TRUE(ch.max_message_size() > 0);
    const string big(ch.max_message_size() + 1, 'x');
    IS_THROWN(ch.put(big), TransportError);

    // a message at the limit arrives whole
    const string fits(ch.max_message_size(), 'y');
    ch.put(fits);
    IS_TRUE(ch.get() == fits);
}

void test_channel_across_processes() {
    Channel ch;
    Process child([&ch]() {
        for (int i = 0; i < 3; ++i) { ch.put("msg " + to_string(i)); }
        return 0;
    }, "writer");
    child.start();
    IS_TRUE(child.started());

    bool in_order = true;
    for (int i = 0; i < 3; ++i) { in_order = in_order and ch.get() == "msg " + to_string(i); }
    IS_TRUE(in_order);
    IS_TRUE(child.join() == 0);
    IS_TRUE(child.exited_cleanly());
}

void test_process_status() {
    Process failing([]() { return 7; }, "seven");
    failing.start();
    IS_TRUE(failing.join() == 7);
    IS_TRUE(not failing.exited_cleanly());
    IS_TRUE(failing.label() == "seven");

    Process throwing([]() -> int { throw std::runtime_error("from child"); }, "thrower");
    throwing.start();
    IS_TRUE(throwing.join() == 1);

    Process throwing_int([]() -> int { throw 42; }, "int thrower");
    throwing_int.start();
    IS_TRUE(throwing_int.join() == 1);

    Process sleeper([]() { sleep(30); return 0; }, "sleeper");
    sleeper.start();
    IS_TRUE(sleeper.is_alive());
    sleeper.kill();
    IS_TRUE(sleeper.exited());
    IS_TRUE(not sleeper.is_alive());
    IS_TRUE(sleeper.exit_code() == 128 + SIGKILL);

    Process unstarted([]() { return 0; });
    IS_THROWN(unstarted.join(), WorkerFailure);
}

void test_codec_non_finite() {
    FullInfoParticle fip({ 0.25, -1.0 }, true, {
        { { numeric_limits<double>::infinity(), 2.0 }, numeric_limits<double>::quiet_NaN(), true }
    });
    const string msg = encode(to_json(fip));
    const FullInfoParticle back = full_particle_from_json(decode(msg));
    IS_TRUE(back.parameter == fip.parameter);
    IS_TRUE(back.accepted);
    IS_TRUE(back.attempts.size() == 1);
    IS_TRUE(std::isnan(back.attempts[0].distance));
    IS_TRUE(std::isinf(back.attempts[0].sum_stat[0]));
}

void test_codec_batches() {
    BatchTask task;
    task.evaluator = "model";
    task.seed = 4294967295UL;
    task.pars = { { 1.0 }, { 2.0 } };
    task.job_ids = { 11, 12 };
    const BatchTask back = batch_task_from_json(decode(encode(to_json(task))));
    IS_TRUE(back.evaluator == "model");
    IS_TRUE(back.seed == task.seed);
    IS_TRUE(back.job_ids == task.job_ids);
    IS_TRUE(back.pars == task.pars);

    BatchResult batch = { { 11, false, FullInfoParticle({ 1.0 }, false, { { { 3.0 }, 9.0, false } }) } };
    const BatchResult rb = batch_result_from_json(decode(encode(to_json(batch))));
    IS_TRUE(rb.size() == 1 and rb[0].job_id == 11 and not rb[0].accepted);
}

void test_codec_malformed() {
    IS_THROWN(decode("{not json"), TransportError);
    IS_THROWN(particle_from_json(decode("{\"parameter\":[1]}")), TransportError);
    IS_THROWN(values_from_json(decode("[1, \"two\"]")), TransportError);
    IS_THROWN(batch_task_from_json(decode("{\"evaluator\":\"m\",\"seed\":-1,\"pars\":[],\"job_ids\":[]}")), TransportError);
    // a sample whose accepted list holds a rejected particle
    IS_THROWN(sample_from_json(decode(
        "{\"record_rejected\":false,\"all_sum_stats\":[],\"accepted\":[{\"parameter\":[1],\"weight\":1,\"distance\":0,\"sum_stat\":[],\"accepted\":false}]}"
    )), TransportError);

    string what;
    IS_TRUE(is_error(decode(encode_error("boom")), &what));
    IS_TRUE(what == "boom");
    IS_TRUE(not is_error(decode("{\"batch\":[]}"), &what));
}

int main() {
    test_channel_in_process();
    test_channel_size_limit();
    test_channel_across_processes();
    test_process_status();
    test_codec_non_finite();
    test_codec_batches();
    test_codec_malformed();
    return test_result();
}
