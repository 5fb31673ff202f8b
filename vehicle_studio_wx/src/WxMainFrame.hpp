#pragma once
#include <wx/wx.h>
#include <wx/splitter.h>
#include <map>
#include <memory>
#include "pipeline/composite_pipeline.hpp"

class WxControlPanel;
class WxPreviewPanel;

class WxMainFrame : public wxFrame
{
public:
    WxMainFrame(wxWindow* parent, std::shared_ptr<const BackdropRegistry> registry);

private:
    wxSplitterWindow* splitter_ {nullptr};
    WxControlPanel* controls_ {nullptr};
    WxPreviewPanel* preview_ {nullptr};

    // Data
    std::shared_ptr<const BackdropRegistry> registry_;
    std::map<wxString, PipelineRequest> imageRequests_;
    wxString currentImagePath_;

    wxDECLARE_EVENT_TABLE();

private:
    void OnQuit(wxCommandEvent&);
    void RefreshPreview();
    bool ProcessFile(const CompositePipeline& pipeline, const wxString& file, const wxString& outDir);
};
