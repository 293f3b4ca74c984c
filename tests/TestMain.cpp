#include <gtest/gtest.h>

#include <wx/init.h>
#include <wx/log.h>

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);

  wxInitializer initializer;
  if (!initializer.IsOk()) {
    fprintf(stderr, "Failed to initialize wxWidgets.\n");
    return 1;
  }
  // Keep expected warnings out of the test output.
  wxLog::SetActiveTarget(new wxLogBuffer());
  wxLog::SetLogLevel(wxLOG_Error);

  return RUN_ALL_TESTS();
}
