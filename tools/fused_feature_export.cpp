// fused_feature_export.cpp — CLI tool for exporting fused per-instrument
// feature matrices.
//
// Pipeline: CSV/DBN readers -> FusionEngine (timeline, alignment, indicator,
// lag/rolling, cross-series, calendar, proxy and macro blocks, fusion guard)
// -> CSV or Parquet, one file per instrument.
//
// Usage: ./fused_feature_export --prices-dir <dir> --output-dir <dir> [options]

#include "config/engine_config.hpp"
#include "fusion/fusion_engine.hpp"
#include "io/csv_series_reader.hpp"
#include "io/dbn_ohlcv_reader.hpp"
#include "io/feature_export.hpp"
#include "io/parquet_export.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// ===========================================================================
// Usage
// ===========================================================================
void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " (--prices-dir <dir> | --price-file <path>...) --output-dir <dir> [options]\n"
              << "\n"
              << "Inputs\n"
              << "  --prices-dir         Directory of price files (*.csv, *.dbn, *.dbn.zst)\n"
              << "  --price-file         Single price file (repeatable)\n"
              << "  --price-granularity  Native granularity of price files (default: --granularity)\n"
              << "  --external           name=path[:granularity[:lag_hours]] (repeatable)\n"
              << "  --transform          name:output=kind:column[:periods[:scale]], name:@macro or\n"
              << "                       name:@market:<prefix>; computed on the source's own rows\n"
              << "                       before alignment (repeatable; kinds pct_change return diff volatility)\n"
              << "\n"
              << "Timeline\n"
              << "  --granularity        Target granularity: 1min 5min 15min 1h 4h 1d 1w (default 1h)\n"
              << "  --start, --end       Analysis window (YYYY-MM-DD[ HH:MM[:SS]])\n"
              << "\n"
              << "Features\n"
              << "  --lags               Lag horizons, e.g. 1,2,24\n"
              << "  --windows            Rolling windows, e.g. 5,20,50\n"
              << "  --pairs              Correlation pairs, e.g. USD_JPY:EUR_USD,EUR_USD:GBP_USD\n"
              << "  --corr-windows       Correlation windows, e.g. 24,72,168\n"
              << "  --strength           Strength currencies, e.g. USD,JPY\n"
              << "  --rsi --stoch --williams --cci --atr --bollinger  Period lists\n"
              << "  --macd               fast:slow pairs, e.g. 12:26,5:10\n"
              << "  --adx --mfi          Single periods\n"
              << "\n"
              << "Fusion & output\n"
              << "  --fill               forward | forward_backward (default forward_backward)\n"
              << "  --max-undefined      Sparse-column warning threshold (default 0.5)\n"
              << "  --workers            Instruments processed in parallel (default 1)\n"
              << "  --format             csv | parquet (default csv)\n"
              << "  --drop-warmup        Omit the leading warm-up rows from the output\n"
              << "  --output-dir         Output directory (created if missing)\n";
}

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    EngineConfig config;
    ExportConfig export_config;
    std::string prices_dir;
    std::vector<std::string> price_files;
    std::string price_granularity;
    std::vector<ExternalSourceSpec> external_specs;
    std::vector<std::pair<std::string, std::vector<SourceTransform>>> transform_args;

    // Parse CLI args
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--drop-warmup") {
                export_config.include_warmup = false;
                continue;
            } else if (!has_value) {
                std::cerr << "Missing value for argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--prices-dir") {
                prices_dir = value;
            } else if (arg == "--price-file") {
                price_files.push_back(value);
            } else if (arg == "--price-granularity") {
                price_granularity = value;
            } else if (arg == "--external") {
                external_specs.push_back(config_parse::parse_external(value));
            } else if (arg == "--transform") {
                transform_args.push_back(config_parse::parse_transform(value));
            } else if (arg == "--output-dir") {
                export_config.output_dir = value;
            } else if (arg == "--granularity") {
                config.timeline.granularity = parse_granularity(value);
            } else if (arg == "--start") {
                config.timeline.start_ts = config_parse::parse_time_arg(value);
            } else if (arg == "--end") {
                config.timeline.end_ts = config_parse::parse_time_arg(value);
            } else if (arg == "--lags") {
                config.lag_rolling.lags = config_parse::parse_int_list(value);
            } else if (arg == "--windows") {
                config.lag_rolling.windows = config_parse::parse_int_list(value);
            } else if (arg == "--pairs") {
                config.cross_series.correlation_pairs = config_parse::parse_pairs(value);
            } else if (arg == "--corr-windows") {
                config.cross_series.correlation_windows = config_parse::parse_int_list(value);
            } else if (arg == "--strength") {
                config.cross_series.strength_currencies = config_parse::split(value, ',');
            } else if (arg == "--rsi") {
                config.indicators.rsi_periods = config_parse::parse_int_list(value);
            } else if (arg == "--stoch") {
                config.indicators.stoch_periods = config_parse::parse_int_list(value);
            } else if (arg == "--williams") {
                config.indicators.williams_periods = config_parse::parse_int_list(value);
            } else if (arg == "--cci") {
                config.indicators.cci_periods = config_parse::parse_int_list(value);
            } else if (arg == "--atr") {
                config.indicators.atr_periods = config_parse::parse_int_list(value);
            } else if (arg == "--bollinger") {
                config.indicators.bollinger_windows = config_parse::parse_int_list(value);
            } else if (arg == "--macd") {
                config.indicators.macd_spans = config_parse::parse_span_pairs(value);
            } else if (arg == "--adx") {
                config.indicators.adx_period = config_parse::parse_size(value);
            } else if (arg == "--mfi") {
                config.indicators.mfi_period = config_parse::parse_size(value);
            } else if (arg == "--fill") {
                config.fusion.fill = parse_fill_policy(value);
            } else if (arg == "--max-undefined") {
                config.fusion.max_undefined_fraction = std::stod(value);
            } else if (arg == "--workers") {
                config.num_workers = config_parse::parse_size(value);
            } else if (arg == "--format") {
                export_config.format = parse_export_format(value);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        for (auto& [source, transforms] : transform_args) {
            auto it = std::find_if(external_specs.begin(), external_specs.end(),
                                   [&](const ExternalSourceSpec& e) { return e.name == source; });
            if (it == external_specs.end()) {
                throw std::invalid_argument("--transform names unknown external source '" + source + "'");
            }
            it->transforms.insert(it->transforms.end(), transforms.begin(), transforms.end());
        }
        config.validate();
        export_config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (prices_dir.empty() && price_files.empty()) {
        std::cerr << "Missing required argument: --prices-dir or --price-file\n";
        print_usage(argv[0]);
        return 1;
    }

    Granularity native = config.timeline.granularity;
    try {
        if (!price_granularity.empty()) native = parse_granularity(price_granularity);
        if (!prices_dir.empty()) {
            auto listed = series_io::list_price_files(prices_dir);
            price_files.insert(price_files.end(), listed.begin(), listed.end());
        }
        std::filesystem::create_directories(export_config.output_dir);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    // Load inputs. A price file that cannot be read is skipped like a failed
    // instrument; a broken external source aborts the run.
    EngineInputs inputs;
    size_t failed = 0;
    for (const auto& path : price_files) {
        std::string instrument = series_io::instrument_from_path(path);
        try {
            if (series_io::is_dbn_path(path)) {
                inputs.prices.push_back(series_io::read_dbn_ohlcv(path, instrument, native));
            } else {
                inputs.prices.push_back(series_io::read_csv_series(path, instrument, native));
            }
            std::cout << "  loaded " << instrument << ": " << inputs.prices.back().size() << " rows\n";
        } catch (const std::exception& e) {
            std::cerr << "FAILED " << instrument << ": " << e.what() << "\n";
            ++failed;
        }
    }
    try {
        for (const auto& spec : external_specs) {
            ExternalInput ext;
            ext.series = series_io::read_csv_series(spec.path, spec.name, spec.granularity);
            ext.policy.publication_lag_ns = spec.publication_lag_ns;
            ext.transforms = spec.transforms;
            std::cout << "  loaded external " << spec.name << ": " << ext.series.size() << " rows\n";
            inputs.externals.push_back(std::move(ext));
        }
    } catch (const std::exception& e) {
        std::cerr << "Cannot load external source: " << e.what() << "\n";
        return 1;
    }
    if (inputs.prices.empty()) {
        std::cerr << "No price series loaded\n";
        return 1;
    }

    std::vector<InstrumentResult> results;
    try {
        FusionEngine engine(config, &std::cerr);
        results = engine.run(inputs);
    } catch (const std::exception& e) {
        std::cerr << "Fusion failed: " << e.what() << "\n";
        return 1;
    }

    FeatureExporter exporter(export_config);
    size_t exported = 0;
    for (const auto& r : results) {
        if (!r.ok) {
            ++failed;
            continue;
        }
        try {
            std::string path = export_config.format == ExportFormat::PARQUET
                                   ? parquet_export::export_parquet(r.matrix, export_config)
                                   : exporter.export_csv(r.matrix);
            std::cout << "  " << r.instrument << ": " << r.report.rows << " rows x "
                      << r.report.columns << " columns, warm-up " << r.report.warmup_rows
                      << ", filled " << r.report.forward_filled << " fwd / "
                      << r.report.backward_filled << " bwd -> " << path << "\n";
            ++exported;
        } catch (const std::exception& e) {
            std::cerr << "FAILED " << r.instrument << ": " << e.what() << "\n";
            ++failed;
        }
    }

    std::cout << "\nInstruments exported: " << exported << "\n";
    if (failed > 0) std::cout << "Instruments failed: " << failed << "\n";
    std::cout << "Output: " << export_config.output_dir << "\n";
    return exported > 0 ? 0 : 1;
}
