#pragma once

int cmd_dataset(int argc, char** argv);
