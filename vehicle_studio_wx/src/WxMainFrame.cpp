#include "WxMainFrame.hpp"
#include <wx/sizer.h>
#include <wx/filename.h>
#include <wx/dir.h>
#include <wx/ffile.h>
#include "WxControlPanel.hpp"
#include "WxPreviewPanel.hpp"
#include "models/PipelineError.hpp"
#include "util/ImageOps.hpp"
#include <opencv2/opencv.hpp>
#include <iostream>

wxBEGIN_EVENT_TABLE(WxMainFrame, wxFrame)
wxEND_EVENT_TABLE()

namespace
{
    bool writeBytes(const wxString& path, const std::vector<uchar>& bytes)
    {
        wxFFile f(path, "wb");
        if (!f.IsOpened()) return false;
        return f.Write(bytes.data(), bytes.size()) == bytes.size();
    }
}

WxMainFrame::WxMainFrame(wxWindow* parent, std::shared_ptr<const BackdropRegistry> registry)
    : wxFrame(parent, wxID_ANY, "Vehicle Studio", wxDefaultPosition, wxSize(2200, 1300)),
      registry_(std::move(registry))
{
    SetMinSize(wxSize(1600, 900));
    // Standard IDs ensure Cmd+Q (Quit) and Cmd+H (Hide) work automatically on macOS
    auto* menuBar = new wxMenuBar();
    auto* fileMenu = new wxMenu();
#ifdef __WXMAC__
    fileMenu->Append(wxID_OSX_HIDE);
    fileMenu->Append(wxID_OSX_HIDEOTHERS);
    fileMenu->AppendSeparator();
#endif
    fileMenu->Append(wxID_EXIT);
    menuBar->Append(fileMenu, "&File");
    SetMenuBar(menuBar);
    Bind(wxEVT_MENU, &WxMainFrame::OnQuit, this, wxID_EXIT);
    splitter_ = new wxSplitterWindow(this, wxID_ANY);
    controls_ = new WxControlPanel(splitter_, registry_->ids());
    preview_  = new WxPreviewPanel(splitter_);
    splitter_->SplitVertically(controls_, preview_, 420);
    splitter_->SetMinimumPaneSize(200);
    Maximize(true);

    // Wire custom events from control panel
    controls_->Bind(wxEVT_STUDIO_SETTINGS_CHANGED, [this](wxCommandEvent&){
        if (!currentImagePath_.IsEmpty())
        {
            imageRequests_[currentImagePath_] = controls_->getRequest();
            RefreshPreview();
        }
    });

    controls_->Bind(wxEVT_STUDIO_BATCH_ITEM_SELECTED, [this](wxCommandEvent& ev){
        currentImagePath_ = ev.GetString();
        if (imageRequests_.count(currentImagePath_))
        {
            controls_->loadRequest(imageRequests_[currentImagePath_]);
        }
        else
        {
            imageRequests_[currentImagePath_] = controls_->getRequest();
        }
        RefreshPreview();
    });

    controls_->Bind(wxEVT_STUDIO_PROCESS_REQUESTED, [this](wxCommandEvent&){
        wxArrayString batch = controls_->getBatchFiles();
        if (batch.IsEmpty()) return;
        wxString outDir = controls_->getOutputFolder();
        if (outDir.IsEmpty()) { preview_->SetStatus("No output folder selected", true); return; }
        // Create full directory path robustly (handles spaces and intermediate dirs)
        wxFileName outFn(outDir, "");
        if (!outFn.DirExists()) {
            if (!outFn.Mkdir(wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
                preview_->SetStatus("Failed to create output folder", true);
                return;
            }
        }
        const CompositePipeline pipeline(registry_, controls_->getSettings());
        int ok = 0;
        for (auto& file : batch)
        {
            if (ProcessFile(pipeline, file, outDir)) ++ok;
        }
        preview_->SetStatus(wxString::Format("Processing complete: %d/%zu images processed successfully", ok, batch.size()), ok != (int)batch.size());
    });
}

void WxMainFrame::RefreshPreview()
{
    const CompositePipeline pipeline(registry_, controls_->getSettings());
    preview_->UpdatePreview(currentImagePath_, pipeline, imageRequests_[currentImagePath_]);
}

bool WxMainFrame::ProcessFile(const CompositePipeline& pipeline, const wxString& file, const wxString& outDir)
{
    cv::Mat img = cv::imread(std::string(file.mb_str()), cv::IMREAD_UNCHANGED);
    if (img.empty())
    {
        std::cerr << "[ProcessFile] cannot open: " << file.mb_str() << std::endl;
        return false;
    }
    const PipelineRequest request = imageRequests_.count(file) ? imageRequests_[file] : controls_->getRequest();
    try
    {
        CompositeResult r = pipeline.run(util::toBGRA(img), request);
        wxFileName inFn(file);
        wxString finalPath = wxFileName(outDir, inFn.GetName() + "_final.jpg").GetFullPath();
        wxString cutoutPath = wxFileName(outDir, inFn.GetName() + "_transparent.png").GetFullPath();
        return writeBytes(finalPath, util::encodeImage(r.finalImage, ".jpg", 92)) &&
               writeBytes(cutoutPath, util::encodeImage(r.transparentCutout, ".png"));
    }
    catch (const PipelineError& e)
    {
        std::cerr << "[ProcessFile] " << file.mb_str() << ": " << toString(e.kind()) << ": " << e.what() << std::endl;
        return false;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[ProcessFile] " << file.mb_str() << ": " << e.what() << std::endl;
        return false;
    }
}

void WxMainFrame::OnQuit(wxCommandEvent&)
{
    Close(true);
}
