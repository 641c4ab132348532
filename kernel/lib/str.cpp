//
// str.cpp
//

#include <lib/str.h>

const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
