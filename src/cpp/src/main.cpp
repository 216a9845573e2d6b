#include "kestrel.h"

int main(int argc, char *argv[]) { return kestrel(argc, const_cast<const char **>(argv)); }
