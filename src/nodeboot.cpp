#include <nodeboot/base/files.h>

#include <nodeboot/bootstrap.h>

int main() { nodeboot::bootstrap_main(nodeboot::real_filesystem); }
