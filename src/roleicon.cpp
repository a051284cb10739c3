// roleicon.cpp
// MIT License (c) 2026 Pedro

#include "commands/roleicon_command.h"

int main(int argc, char** argv) {
    return run_roleicon(argc, argv);
}
