#pragma once

int run_roleicon(int argc, char** argv);
