// Exports nothing the host looks for.
extern "C" int toolbench_fixture_answer() { return 42; }
