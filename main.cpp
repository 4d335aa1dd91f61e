#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"

using namespace std;


int main(int argc, char* argv[]) {
    return runCommand(vector<string>(argv + 1, argv + argc), cout, cerr);
}
