#include <chrono>
#include <fstream>
#include <sstream>
#include <iomanip>
#include "helpers.hpp"
using namespace std;

Timestamp getCurrentTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

json readJsonFromFile(const string& filepath) {
    ifstream input(filepath);
    if (!input.is_open()) {
        return json::array();
    }
    stringstream buffer;
    buffer << input.rdbuf();
    if (buffer.str().empty()) {
        return json::array();
    }
    return json::parse(buffer.str());
}

vector<string> splitString(const string& s, char delim) {
    vector<string> ret;
    stringstream ss(s);
    string item;
    while (getline(ss, item, delim)) {
        if (!item.empty()) ret.push_back(item);
    }
    return ret;
}

string memberListToString(const vector<MemberId>& members) {
    string out;
    for (size_t i = 0; i < members.size(); i++) {
        if (i > 0) out += ",";
        out += members[i];
    }
    return out;
}

string uint64ToKey(uint64_t value) {
    stringstream ss;
    ss << setw(20) << setfill('0') << value;
    return ss.str();
}
