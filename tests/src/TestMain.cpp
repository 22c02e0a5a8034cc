#include "pch.h"
#include <wx/app.h>
#include <wx/init.h>
#include <wx/config.h>
#include <wx/log.h>

class TestWxAppForGTest : public wxAppConsole
{
public:
    virtual bool OnInit() override
    {
        SetAppName("CleanNamesTests");
        if (!wxAppConsole::OnInit())
        {
            return false;
        }
        // Engine warnings (copy fallback, restore failures) go to stderr instead of a modal target
        wxLog::SetActiveTarget(new wxLogStderr());
        wxLog::DisableTimestamp();
        return true;
    }
};

wxIMPLEMENT_APP_NO_MAIN(TestWxAppForGTest);

class WxWidgetsGlobalEnvironment : public ::testing::Environment
{
public:
    virtual void SetUp() override
    {
        wxApp::SetInstance(new TestWxAppForGTest());
        char appname[] = "CleanNamesTests";
        char *argv_[] = {appname, nullptr};
        int argc_ = 1;

        if (!wxEntryStart(argc_, argv_))
        {
            FAIL() << "wxEntryStart failed. wxWidgets could not be initialized for tests.";
            return;
        }

        if (wxTheApp)
        {
            if (!wxTheApp->CallOnInit())
            {
                FAIL() << "wxTheApp->CallOnInit() failed.";
                wxEntryCleanup();
            }
        }
        else
        {
            FAIL() << "wxTheApp is null after wxEntryStart. wxWidgets initialization incomplete.";
            wxEntryCleanup();
        }
    }

    virtual void TearDown() override
    {
        if (wxTheApp)
        {
            wxTheApp->OnExit();
        }
        wxEntryCleanup();
    }
};

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new WxWidgetsGlobalEnvironment);
    return RUN_ALL_TESTS();
}
