#include "common/utils.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace sortbot {
using namespace std;

string random_uuid() {
    // random_generator 不是线程安全的，每个线程持有自己的生成器
    thread_local boost::uuids::random_generator generator;
    return boost::lexical_cast<string>(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace sortbot
