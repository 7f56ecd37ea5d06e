#include <cmath>
#include <cstdio>
#include <facsforge/facsforge.hpp>
#include <random>
#include <vector>

// Two-level gating on synthetic data: a scatter gate on linear FSC/SSC, then
// a logicle-scaled CD4/CD8 gate inside it.
int main()
{
    facsforge::Logger::instance().add_sink(facsforge::sinks::console_sink());

    std::mt19937                     rng(7);
    std::normal_distribution<double> fsc(60000.0, 15000.0), ssc(30000.0, 10000.0);
    std::normal_distribution<double> cd4(2000.0, 1500.0), cd8(-50.0, 200.0);

    const size_t        n = 5000;
    std::vector<double> c_fsc(n), c_ssc(n), c_cd4(n), c_cd8(n);
    for (size_t i = 0; i < n; ++i)
    {
        c_fsc[i] = fsc(rng);
        c_ssc[i] = ssc(rng);
        c_cd4[i] = cd4(rng);
        c_cd8[i] = cd8(rng);
    }
    facsforge::EventMatrix events({"FSC-A", "SSC-A", "CD4", "CD8"}, {c_fsc, c_ssc, c_cd4, c_cd8});

    facsforge::TransformSet transforms;
    facsforge::LogicleTransform logicle({.T = 262144.0, .W = 0.5, .M = 4.5, .A = 0.0});
    transforms.set("CD4", logicle);
    transforms.set("CD8", logicle);

    const double zero = logicle.to_display(0.0);

    facsforge::GateHierarchyBuilder builder;
    auto root = builder.add_root("All Events");
    auto lymph = builder.add_child(
        root,
        "Lymphocytes",
        facsforge::Gate{"FSC-A", "SSC-A",
         facsforge::PolygonGate{{{30000, 10000}, {90000, 10000}, {90000, 50000}, {30000, 50000}}}});
    builder.add_child(lymph,
                      "CD4+",
                      facsforge::Gate{"CD4", "CD8", facsforge::RectangleGate{zero + 0.1, 1.0, 0.0, zero + 0.1}});
    auto tree = builder.build();

    auto result = facsforge::evaluate(tree, transforms, events);

    for (const auto& s : facsforge::summarize(tree, result))
    {
        std::printf("%-12s %6zu  %6.2f%% of parent  median (%.3f, %.3f)\n",
                    s.name.c_str(),
                    s.count,
                    s.percent_of_parent,
                    s.median_x,
                    s.median_y);
    }

    const auto stems = facsforge::population_file_stems(tree);
    for (auto id : tree.depth_first())
    {
        if (!tree.node(id).gate)
            continue;
        facsforge::SvgPopulationPlot plot(tree, result, id);
        plot.write_svg(stems[id] + ".svg");
    }

    return 0;
}
