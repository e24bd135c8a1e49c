// Test stubs for globals defined in main.cpp
// These are needed when testing code that references these globals

// Debug level - quiet for tests
int g_debug_level = 0;
