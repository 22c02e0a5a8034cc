#ifndef APP_H
#define APP_H

#include <wx/app.h>

#include "CommandLine.h"
#include "MetadataReader.h"
#include "UndoStore.h"

#include <memory>

class RenameController;

class App : public wxAppConsole
{
public:
	App();
	~App() override;

	bool OnInit() override;
	int OnRun() override;
	int OnExit() override;

	void OnInitCmdLine(wxCmdLineParser &parser) override;
	bool OnCmdLineParsed(wxCmdLineParser &parser) override;

private:
	CommandOptions m_options;
	ExifMetadataReader m_metadataReader;
	std::unique_ptr<UndoStore> m_undoStore;
	std::unique_ptr<RenameController> m_controller;

#ifdef __UNIX__
	static void OnInterrupt(int signal);
#endif
};

wxDECLARE_APP(App);

#endif // APP_H
