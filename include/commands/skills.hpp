#pragma once

int cmd_skills(int argc, char** argv);
