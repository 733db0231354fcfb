#pragma once

#define BRAID_VERSION_MAJOR 0
#define BRAID_VERSION_MINOR 4
#define BRAID_VERSION_INCREMENTAL 0
#define BRAID_VERSION_STRING "0.4.0"
