#include <wx/wx.h>
#include "WxMainFrame.hpp"
#include "backdrops/backdrop_registry.hpp"
#include <wx/display.h>
#include <cstdlib>
#include <exception>
#include <iostream>

class VehicleStudioApp : public wxApp
{
public:
    bool OnInit() override
    {
        if (!wxApp::OnInit()) return false;
        wxInitAllImageHandlers();

        // Extra backdrops come from a folder named in the environment, if any.
        BackdropRegistry::Builder builder;
        builder.addDefaultStudios();
        if (const char* dir = std::getenv("VEHICLE_STUDIO_BACKDROPS"))
        {
            try
            {
                builder.loadDirectory(dir);
            }
            catch (const std::exception& e)
            {
                std::cerr << "[OnInit] ignoring VEHICLE_STUDIO_BACKDROPS: " << e.what() << std::endl;
            }
        }
        WxMainFrame* frame = new WxMainFrame(nullptr, builder.build());

        // Force a large initial size on the primary display and maximize
        if (wxDisplay::GetCount() > 0) {
            wxDisplay d(0u);
            wxRect ar = d.GetClientArea();
            int w = (ar.GetWidth() * 95) / 100;
            int h = (ar.GetHeight() * 95) / 100;
            frame->SetSize(w, h);
            frame->Centre();
        }
        frame->Maximize(true);
        frame->Raise();
        frame->Show(true);
        return true;
    }
};

wxIMPLEMENT_APP(VehicleStudioApp);
