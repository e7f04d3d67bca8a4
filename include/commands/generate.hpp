#pragma once

int cmd_generate(int argc, char** argv);
