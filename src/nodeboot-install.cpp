#include <nodeboot/base/files.h>

#include <nodeboot/bootstrap.h>

// The same flow as nodeboot, kept under the installer name.
int main() { nodeboot::bootstrap_main(nodeboot::real_filesystem); }
