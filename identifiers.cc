#include "identifiers.h"

#include <cctype>
#include <ctime>
#include <uuid/uuid.h>

using namespace std;

namespace parkcore {

Id newId() {
    uuid_t u; uuid_generate(u);
    char buf[37]; uuid_unparse_lower(u, buf);
    return string{buf};
}

static string formatUtc(TimePoint t, const char* fmt) {
    time_t tt = chrono::system_clock::to_time_t(t);
    tm parts{};
    gmtime_r(&tt, &parts);
    char buf[16];
    size_t n = strftime(buf, sizeof(buf), fmt, &parts);
    return string(buf, n);
}

string shortDate(TimePoint t) { return formatUtc(t, "%y%m%d"); }
string longDate(TimePoint t)  { return formatUtc(t, "%Y%m%d"); }

string makeTokenNumber(TimePoint t) {
    string suffix = newId().substr(0, 6);
    for (char& c : suffix) c = (char)toupper((unsigned char)c);
    return "TK" + shortDate(t) + "-" + suffix;
}

string makeReceiptNumber(TimePoint t) {
    static const char alphabet[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    uuid_t u; uuid_generate_random(u);
    string suffix;
    for (int i = 0; i < 6; ++i) suffix += alphabet[u[i] % 36];
    return "RCP" + longDate(t) + "-" + suffix;
}

} // namespace parkcore
