#include "WxPreviewPanel.hpp"
#include "models/PipelineError.hpp"
#include "util/ImageOps.hpp"
#include <wx/sizer.h>
#include <wx/filename.h>
#include <wx/image.h>
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cstring>

wxBEGIN_EVENT_TABLE(WxPreviewPanel, wxPanel)
    EVT_SIZE(WxPreviewPanel::OnSize)
wxEND_EVENT_TABLE()

namespace
{
    // Deep-copy convert Mat(BGR) -> wxBitmap (RGB)
    wxBitmap toWxBitmap(const cv::Mat& bgr)
    {
        if (bgr.empty()) return wxBitmap();
        cv::Mat rgb; cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
        const size_t size = static_cast<size_t>(rgb.cols) * static_cast<size_t>(rgb.rows) * 3;
        unsigned char* buf = new unsigned char[size];
        std::memcpy(buf, rgb.data, size);
        wxImage wi(rgb.cols, rgb.rows, buf, false /*wxImage owns and frees buf*/);
        return wxBitmap(wi);
    }

    // Flatten a BGRA cutout over a checkerboard so transparency stays visible.
    cv::Mat flattenOnChecker(const cv::Mat& bgra, int cell = 16)
    {
        cv::Mat out(bgra.size(), CV_8UC3);
        for (int y = 0; y < bgra.rows; ++y)
        {
            const cv::Vec4b* src = bgra.ptr<cv::Vec4b>(y);
            cv::Vec3b* dst = out.ptr<cv::Vec3b>(y);
            for (int x = 0; x < bgra.cols; ++x)
            {
                const int bg = (((x / cell) + (y / cell)) & 1) ? 200 : 235;
                const int a = src[x][3];
                for (int c = 0; c < 3; ++c)
                    dst[x][c] = cv::saturate_cast<uchar>((src[x][c] * a + bg * (255 - a)) / 255);
            }
        }
        return out;
    }
}

WxPreviewPanel::WxPreviewPanel(wxWindow* parent)
    : wxPanel(parent), overlayHideTimer_(this)
{
    BuildUI();
    overlayHideTimer_.Bind(wxEVT_TIMER, [this](wxTimerEvent&){ overlay_->Hide(); });
}

void WxPreviewPanel::BuildUI()
{
    auto* root = new wxBoxSizer(wxVERTICAL);
    scroll_ = new wxScrolledWindow(this, wxID_ANY, wxDefaultPosition, wxDefaultSize, wxVSCROLL | wxHSCROLL);
    scroll_->SetScrollRate(10, 10);
    auto* content = new wxPanel(scroll_);
    auto* grid = new wxGridSizer(1, 2, 8, 8);

    // Cutout
    auto* origPanel = new wxPanel(content);
    auto* oSizer = new wxBoxSizer(wxVERTICAL);
    originalTitle_ = new wxStaticText(origPanel, wxID_ANY, "Cutout");
    originalBmp_ = new wxStaticBitmap(origPanel, wxID_ANY, wxNullBitmap, wxDefaultPosition, wxSize(400, 400));
    oSizer->Add(originalTitle_, 0, wxALL, 4);
    oSizer->Add(originalBmp_, 1, wxEXPAND | wxALL, 4);
    origPanel->SetSizer(oSizer);

    // Composite
    auto* resPanel = new wxPanel(content);
    auto* rSizer = new wxBoxSizer(wxVERTICAL);
    resultTitle_ = new wxStaticText(resPanel, wxID_ANY, "Composite");
    resultBmp_ = new wxStaticBitmap(resPanel, wxID_ANY, wxNullBitmap, wxDefaultPosition, wxSize(400, 400));
    rSizer->Add(resultTitle_, 0, wxALL, 4);
    rSizer->Add(resultBmp_, 1, wxEXPAND | wxALL, 4);
    resPanel->SetSizer(rSizer);

    grid->Add(origPanel, 1, wxEXPAND | wxALL, 8);
    grid->Add(resPanel, 1, wxEXPAND | wxALL, 8);

    content->SetSizer(grid);
    auto* scrollSizer = new wxBoxSizer(wxVERTICAL);
    scrollSizer->Add(content, 1, wxEXPAND | wxALL, 8);
    scroll_->SetSizer(scrollSizer);
    scroll_->FitInside();

    root->Add(scroll_, 1, wxEXPAND);

    // Overlay label centered (no opacity animation, simple timer)
    overlay_ = new wxStaticText(this, wxID_ANY, "", wxDefaultPosition, wxDefaultSize, wxALIGN_CENTER);
    overlay_->Hide();
    overlay_->SetBackgroundColour(wxColour(0,0,0,0));

    SetSizer(root);
}

void WxPreviewPanel::LayoutImages()
{
    // Fit images within each column's visible width and overall height
    wxSize client = scroll_->GetClientSize();
    int gutters = 60; // approximate padding + gaps
    int availWPerPanel = std::max(120, (client.x - gutters) / 2);
    int availH = std::max(120, client.y - 60);

    auto scaleMatToFit = [&](const cv::Mat& bgr){
        if (bgr.empty()) return wxBitmap();
        double sx = double(availWPerPanel) / std::max(1, bgr.cols);
        double sy = double(availH) / std::max(1, bgr.rows);
        double s = std::min(sx, sy);
        int nw = std::max(1, int(bgr.cols * s));
        int nh = std::max(1, int(bgr.rows * s));
        cv::Mat resized; cv::resize(bgr, resized, cv::Size(nw, nh), 0, 0, cv::INTER_LANCZOS4);
        return toWxBitmap(resized);
    };

    originalBmp_->SetBitmap(scaleMatToFit(originalMat_));
    resultBmp_->SetBitmap(scaleMatToFit(resultMat_));

    // Position overlay to cover full panel
    overlay_->SetSize(GetClientSize());
    overlay_->Move(0, 0);

    scroll_->FitInside();
    scroll_->Layout();
    this->Layout();
    this->Refresh();
}

void WxPreviewPanel::OnSize(wxSizeEvent&)
{
    LayoutImages();
}

void WxPreviewPanel::UpdatePreview(const wxString& imagePath, const CompositePipeline& pipeline, const PipelineRequest& request)
{
    currentImagePath_ = imagePath;
    cv::Mat img = cv::imread(std::string(imagePath.mb_str()), cv::IMREAD_UNCHANGED);
    if (img.empty()) { SetStatus("Failed to load image", true); return; }

    try
    {
        cv::Mat bgra = util::toBGRA(img);
        originalMat_ = flattenOnChecker(bgra);
        originalTitle_->SetLabel("Cutout (" + wxString::Format("%dx%d", bgra.cols, bgra.rows) + ")");

        CompositeResult r = pipeline.run(bgra, request);
        resultMat_ = r.finalImage;
        resultTitle_->SetLabel(wxString::Format("Composite (%dx%d, %s, scale %.2f%s)",
                                                r.finalImage.cols, r.finalImage.rows,
                                                toString(r.orientation), r.scaleUsed,
                                                r.plateMasked ? ", plate masked" : ""));
        LayoutImages();
        ShowOverlay(wxString::FromUTF8("Preview"), wxColour(100, 100, 100), 600);
    }
    catch (const PipelineError& e)
    {
        resultMat_.release();
        resultTitle_->SetLabel("Composite");
        LayoutImages();
        SetStatus(wxString::FromUTF8(toString(e.kind())) + ": " + wxString::FromUTF8(e.what()), true);
    }
    catch (const cv::Exception& e)
    {
        resultMat_.release();
        resultTitle_->SetLabel("Composite");
        LayoutImages();
        SetStatus("OpenCV: " + wxString::FromUTF8(e.what()), true);
    }
}

void WxPreviewPanel::ClearPreview()
{
    originalMat_.release();
    resultMat_.release();
    currentImagePath_.clear();
    originalTitle_->SetLabel("Cutout");
    resultTitle_->SetLabel("Composite");
    LayoutImages();
}

void WxPreviewPanel::SetStatus(const wxString& message, bool isError)
{
    if (!isError) return;
    ShowOverlay(message, wxColour(220, 50, 47), 1600);
}

void WxPreviewPanel::ShowOverlay(const wxString& text, const wxColour& color, int durationMs)
{
    overlay_->SetLabel(text);
    overlay_->SetForegroundColour(color);
    overlay_->SetFont(wxFont(wxFontInfo(32).Bold()));
    overlay_->SetSize(GetClientSize());
    overlay_->CentreOnParent();
    overlay_->Show();
    overlayHideTimer_.StartOnce(durationMs);
}
